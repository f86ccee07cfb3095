#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "abstractions.hpp"
#include "errors.hpp"
#include "persistent_array_map.hpp"
#include "persistent_hash_map.hpp"
#include "persistent_hash_set.hpp"
#include "persistent_list.hpp"
#include "persistent_tree_map.hpp"
#include "persistent_tree_set.hpp"
#include "persistent_vector.hpp"

namespace py = pybind11;
using namespace pcoll;

namespace {

std::optional<Value> tryToValue(py::handle obj);

// Python object -> Value; TypeError for unsupported objects
Value toValue(py::handle obj) {
    std::optional<Value> v = tryToValue(obj);
    if (!v) {
        throw py::type_error("Unsupported value type: " + std::string(py::str(obj.get_type())));
    }
    return *v;
}

std::optional<Value> tryToValue(py::handle obj) {
    if (obj.is_none()) return Value();
    if (py::isinstance<py::bool_>(obj)) return Value(obj.cast<bool>());
    if (py::isinstance<py::int_>(obj)) return Value(obj.cast<int64_t>());
    if (py::isinstance<py::float_>(obj)) return Value(obj.cast<double>());
    if (py::isinstance<py::str>(obj)) return Value(obj.cast<std::string>());

    if (py::isinstance<PersistentVector>(obj)) return Value::wrap(obj.cast<PersistentVector>());
    if (py::isinstance<PersistentList>(obj)) return Value::wrap(obj.cast<PersistentList>());
    if (py::isinstance<PersistentHashMap>(obj)) return Value::wrap(obj.cast<PersistentHashMap>());
    if (py::isinstance<PersistentArrayMap>(obj)) return Value::wrap(obj.cast<PersistentArrayMap>());
    if (py::isinstance<PersistentHashSet>(obj)) return Value::wrap(obj.cast<PersistentHashSet>());
    if (py::isinstance<PersistentTreeMap>(obj)) return Value::wrap(obj.cast<PersistentTreeMap>());
    if (py::isinstance<PersistentTreeSet>(obj)) return Value::wrap(obj.cast<PersistentTreeSet>());

    // Plain Python containers: tuples and lists become vectors
    if (py::isinstance<py::tuple>(obj) || py::isinstance<py::list>(obj)) {
        PersistentVector vec;
        for (py::handle item : obj) {
            vec = vec.conj(toValue(item));
        }
        return Value::wrap(vec);
    }
    if (py::isinstance<py::dict>(obj)) {
        PersistentHashMap map;
        for (auto item : obj.cast<py::dict>()) {
            map = map.assoc(toValue(item.first), toValue(item.second));
        }
        return Value::wrap(map);
    }
    if (py::isinstance<py::set>(obj) || py::isinstance<py::frozenset>(obj)) {
        PersistentHashSet set;
        for (py::handle item : obj) {
            set = set.conj(toValue(item));
        }
        return Value::wrap(set);
    }
    return std::nullopt;
}

py::object fromValue(const Value& v) {
    switch (v.type()) {
        case ValueType::NIL: return py::none();
        case ValueType::BOOLEAN: return py::bool_(v.asBool());
        case ValueType::INTEGER: return py::int_(v.asInteger());
        case ValueType::FLOAT: return py::float_(v.asFloat());
        case ValueType::STRING: return py::str(v.asString());
        case ValueType::CHAR:
        case ValueType::KEYWORD:
        case ValueType::SYMBOL: return py::str(v.toString());
        default: break;
    }
    if (auto* vec = v.as<PersistentVector>()) return py::cast(*vec);
    if (auto* list = v.as<PersistentList>()) return py::cast(*list);
    if (auto* map = v.as<PersistentHashMap>()) return py::cast(*map);
    if (auto* map = v.as<PersistentArrayMap>()) return py::cast(*map);
    if (auto* set = v.as<PersistentHashSet>()) return py::cast(*set);
    if (auto* map = v.as<PersistentTreeMap>()) return py::cast(*map);
    if (auto* set = v.as<PersistentTreeSet>()) return py::cast(*set);

    // Any other sequence view is realized into a Python list
    py::list out;
    for (SeqPtr s = seq(v); s; s = s->next()) {
        out.append(fromValue(s->first()));
    }
    return std::move(out);
}

// Python iterator over a sequence view
class SeqIterator {
public:
    explicit SeqIterator(SeqPtr s) : current_(s ? s->seq() : nullptr) {}

    py::object next() {
        if (!current_) {
            throw py::stop_iteration();
        }
        Value v = current_->first();
        current_ = current_->next();
        return fromValue(v);
    }

private:
    SeqPtr current_;
};

// Map entries as (key, value) tuples
py::list entryList(SeqPtr s) {
    py::list out;
    for (s = s ? s->seq() : nullptr; s; s = s->next()) {
        MapEntry e = entryFromValue(s->first());
        out.append(py::make_tuple(fromValue(e.key), fromValue(e.value)));
    }
    return out;
}

py::list valueList(SeqPtr s) {
    py::list out;
    for (s = s ? s->seq() : nullptr; s; s = s->next()) {
        out.append(fromValue(s->first()));
    }
    return out;
}

std::optional<Bound> toBound(const py::object& key, bool inclusive) {
    if (key.is_none()) return std::nullopt;
    return Bound(toValue(key), inclusive);
}

// __len__ / __eq__ / __hash__ / __repr__ shared by every collection class
template <typename T>
void addValueProtocol(py::class_<T>& cls) {
    cls.def("__len__", [](const T& c) { return c.count(); },
            "Number of elements (O(1)).")
        .def("__eq__",
             [](const T& c, py::object other) {
                 std::optional<Value> v = tryToValue(other);
                 return v && Value::wrap(c) == *v;
             },
             py::arg("other"),
             "Structural equality.")
        .def("__hash__", [](const T& c) { return c.hash(); },
             "Structural hash; equal collections hash alike.")
        .def("__repr__", [](const T& c) { return c.toString(); });
}

}  // namespace

PYBIND11_MODULE(pcoll, m) {
    m.doc() = "Persistent collections over a 32-way trie and red-black trees";

    py::register_exception<CapabilityError>(m, "CapabilityError", PyExc_TypeError);
    py::register_exception<ComparatorError>(m, "ComparatorError", PyExc_TypeError);
    py::register_exception<IllegalStateError>(m, "IllegalStateError", PyExc_RuntimeError);
    py::register_exception<PatternError>(m, "PatternError", PyExc_ValueError);

    py::class_<SeqIterator>(m, "SeqIterator")
        .def("__iter__", [](SeqIterator& it) -> SeqIterator& { return it; })
        .def("__next__", &SeqIterator::next);

    //=========================================================================
    // Vector
    //=========================================================================

    py::class_<PersistentVector> vector(m, "Vector");
    vector
        .def(py::init<>(), "Create an empty Vector")
        .def(py::init([](py::iterable items) {
                 PersistentVector vec;
                 for (py::handle item : items) {
                     vec = vec.conj(toValue(item));
                 }
                 return vec;
             }),
             py::arg("items"),
             "Create a Vector holding the items of an iterable, in order")

        .def("conj", [](const PersistentVector& v, py::object x) { return v.conj(toValue(x)); },
             py::arg("x"),
             "Append x, returning a new vector.")

        .def("assoc",
             [](const PersistentVector& v, size_t idx, py::object x) { return v.assoc(idx, toValue(x)); },
             py::arg("index"), py::arg("x"),
             "Replace the element at index (index == len appends), returning a new vector.\n\n"
             "Raises:\n"
             "    IndexError: index > len")

        .def("pop", &PersistentVector::pop,
             "Remove the last element, returning a new vector.\n\n"
             "Raises:\n"
             "    IllegalStateError: the vector is empty")

        .def("peek", [](const PersistentVector& v) { return fromValue(v.peek()); },
             "Last element, or None when empty.")

        .def("nth", [](const PersistentVector& v, size_t idx) { return fromValue(v.nth(idx)); },
             py::arg("index"),
             "Element at index; raises IndexError out of bounds.")

        .def("get",
             [](const PersistentVector& v, size_t idx, py::object dflt) {
                 return fromValue(v.get(idx, toValue(dflt)));
             },
             py::arg("index"), py::arg("default") = py::none(),
             "Element at index, or default out of bounds.")

        .def("__getitem__",
             [](const PersistentVector& v, int64_t idx) {
                 if (idx < 0) idx += static_cast<int64_t>(v.size());
                 if (idx < 0) throw IndexError(idx, v.size());
                 return fromValue(v.nth(static_cast<size_t>(idx)));
             },
             py::arg("index"))

        .def("__getitem__",
             [](const PersistentVector& v, py::slice slice) {
                 size_t start, stop, step, length;
                 if (!slice.compute(v.size(), &start, &stop, &step, &length)) {
                     throw py::error_already_set();
                 }
                 if (step != 1) {
                     throw py::value_error("Vector slices do not support a step");
                 }
                 return v.slice(start, start + length);
             },
             py::arg("slice"))

        .def("__iter__", [](const PersistentVector& v) { return SeqIterator(v.seq()); })
        .def("__reversed__", [](const PersistentVector& v) { return SeqIterator(v.reverseSeq()); })
        .def("to_list", [](const PersistentVector& v) { return valueList(v.seq()); },
             "Elements as a Python list.");
    addValueProtocol(vector);

    //=========================================================================
    // List
    //=========================================================================

    py::class_<PersistentList> list(m, "List");
    list
        .def(py::init<>(), "Create an empty List")
        .def(py::init([](py::iterable items) {
                 std::vector<Value> values;
                 for (py::handle item : items) {
                     values.push_back(toValue(item));
                 }
                 return PersistentList::fromValues(values);
             }),
             py::arg("items"),
             "Create a List whose head is the first item")

        .def("conj", [](const PersistentList& l, py::object x) { return l.conj(toValue(x)); },
             py::arg("x"),
             "Prepend x, returning a new list.")

        .def("peek", [](const PersistentList& l) { return fromValue(l.peek()); },
             "Head element, or None when empty.")

        .def("pop", &PersistentList::pop,
             "Drop the head, returning the rest.\n\n"
             "Raises:\n"
             "    IllegalStateError: the list is empty")

        .def("nth", [](const PersistentList& l, size_t idx) { return fromValue(l.nth(idx)); },
             py::arg("index"),
             "Element at index (linear walk); raises IndexError out of bounds.")

        .def("__iter__", [](const PersistentList& l) { return SeqIterator(l.seq()); });
    addValueProtocol(list);

    //=========================================================================
    // HashMap
    //=========================================================================

    py::class_<PersistentHashMap> hashMap(m, "HashMap");
    hashMap
        .def(py::init<>(), "Create an empty HashMap")
        .def(py::init([](py::dict d) {
                 PersistentHashMap map;
                 for (auto item : d) {
                     map = map.assoc(toValue(item.first), toValue(item.second));
                 }
                 return map;
             }),
             py::arg("dict"),
             "Create a HashMap from a Python dict")

        .def("assoc",
             [](const PersistentHashMap& map, py::object k, py::object v) {
                 return map.assoc(toValue(k), toValue(v));
             },
             py::arg("key"), py::arg("val"),
             "Associate key with value, returning a new map.")

        .def("dissoc", [](const PersistentHashMap& map, py::object k) { return map.dissoc(toValue(k)); },
             py::arg("key"),
             "Remove key, returning a new map.")

        .def("get",
             [](const PersistentHashMap& map, py::object k, py::object dflt) {
                 std::optional<MapEntry> e = map.find(toValue(k));
                 return e ? fromValue(e->value) : dflt;
             },
             py::arg("key"), py::arg("default") = py::none(),
             "Value for key, or default when the key is absent.\n\n"
             "A key stored with None returns None, not default.")

        .def("find",
             [](const PersistentHashMap& map, py::object k) -> py::object {
                 std::optional<MapEntry> e = map.find(toValue(k));
                 if (!e) return py::none();
                 return py::make_tuple(fromValue(e->key), fromValue(e->value));
             },
             py::arg("key"),
             "(key, value) tuple, or None when the key is absent.")

        .def("merge",
             [](const PersistentHashMap& map, py::object other) {
                 return map.merge(*toValue(other).asCollection());
             },
             py::arg("other"),
             "Entries of other added over this map.")

        .def("__getitem__",
             [](const PersistentHashMap& map, py::object k) {
                 std::optional<MapEntry> e = map.find(toValue(k));
                 if (!e) throw py::key_error(py::str(k));
                 return fromValue(e->value);
             },
             py::arg("key"))

        .def("__contains__", [](const PersistentHashMap& map, py::object k) { return map.contains(toValue(k)); },
             py::arg("key"))
        .def("__iter__", [](const PersistentHashMap& map) { return SeqIterator(map.keys()); })
        .def("keys", [](const PersistentHashMap& map) { return valueList(map.keys()); })
        .def("values", [](const PersistentHashMap& map) { return valueList(map.vals()); })
        .def("items", [](const PersistentHashMap& map) { return entryList(map.seq()); });
    addValueProtocol(hashMap);

    //=========================================================================
    // ArrayMap
    //=========================================================================

    py::class_<PersistentArrayMap> arrayMap(m, "ArrayMap");
    arrayMap
        .def(py::init<>(), "Create an empty ArrayMap (insertion ordered, at most 8 entries)")

        .def("assoc",
             [](const PersistentArrayMap& map, py::object k, py::object v) {
                 // A ninth key promotes the result to a HashMap
                 return fromValue(map.associate(toValue(k), toValue(v)));
             },
             py::arg("key"), py::arg("val"),
             "Associate key with value; returns a HashMap once the map outgrows 8 entries.")

        .def("dissoc", [](const PersistentArrayMap& map, py::object k) { return map.dissoc(toValue(k)); },
             py::arg("key"),
             "Remove key, returning a new map.")

        .def("get",
             [](const PersistentArrayMap& map, py::object k, py::object dflt) {
                 std::optional<MapEntry> e = map.find(toValue(k));
                 return e ? fromValue(e->value) : dflt;
             },
             py::arg("key"), py::arg("default") = py::none())

        .def("__getitem__",
             [](const PersistentArrayMap& map, py::object k) {
                 std::optional<MapEntry> e = map.find(toValue(k));
                 if (!e) throw py::key_error(py::str(k));
                 return fromValue(e->value);
             },
             py::arg("key"))

        .def("__contains__", [](const PersistentArrayMap& map, py::object k) { return map.contains(toValue(k)); },
             py::arg("key"))
        .def("__iter__",
             [](const PersistentArrayMap& map) {
                 std::vector<Value> keys;
                 for (const MapEntry& e : map.getEntries()) {
                     keys.push_back(e.key);
                 }
                 return SeqIterator(seqOf(std::move(keys)));
             })
        .def("items", [](const PersistentArrayMap& map) { return entryList(map.seq()); });
    addValueProtocol(arrayMap);

    //=========================================================================
    // HashSet
    //=========================================================================

    py::class_<PersistentHashSet> hashSet(m, "HashSet");
    hashSet
        .def(py::init<>(), "Create an empty HashSet")
        .def(py::init([](py::iterable items) {
                 PersistentHashSet set;
                 for (py::handle item : items) {
                     set = set.conj(toValue(item));
                 }
                 return set;
             }),
             py::arg("items"),
             "Create a HashSet from an iterable")

        .def("conj", [](const PersistentHashSet& s, py::object x) { return s.conj(toValue(x)); },
             py::arg("x"),
             "Add x, returning a new set.")

        .def("disj", [](const PersistentHashSet& s, py::object x) { return s.disj(toValue(x)); },
             py::arg("x"),
             "Remove x, returning a new set (unchanged when absent).")

        .def("union", &PersistentHashSet::unionWith, py::arg("other"))
        .def("intersection", &PersistentHashSet::intersection, py::arg("other"))
        .def("difference", &PersistentHashSet::difference, py::arg("other"))
        .def("symmetric_difference", &PersistentHashSet::symmetricDifference, py::arg("other"))
        .def("issubset", &PersistentHashSet::isSubset, py::arg("other"))
        .def("issuperset", &PersistentHashSet::isSuperset, py::arg("other"))
        .def("isdisjoint", &PersistentHashSet::isDisjoint, py::arg("other"))

        .def("__contains__", [](const PersistentHashSet& s, py::object x) { return s.contains(toValue(x)); },
             py::arg("x"))
        .def("__iter__", [](const PersistentHashSet& s) { return SeqIterator(s.seq()); });
    addValueProtocol(hashSet);

    //=========================================================================
    // SortedMap
    //=========================================================================

    py::class_<PersistentTreeMap> sortedMap(m, "SortedMap");
    sortedMap
        .def(py::init<>(), "Create an empty SortedMap ordered by the default comparator")
        .def(py::init([](py::dict d) {
                 PersistentTreeMap map;
                 for (auto item : d) {
                     map = map.assoc(toValue(item.first), toValue(item.second));
                 }
                 return map;
             }),
             py::arg("dict"),
             "Create a SortedMap from a Python dict")

        .def("assoc",
             [](const PersistentTreeMap& map, py::object k, py::object v) {
                 return map.assoc(toValue(k), toValue(v));
             },
             py::arg("key"), py::arg("val"))

        .def("dissoc", [](const PersistentTreeMap& map, py::object k) { return map.dissoc(toValue(k)); },
             py::arg("key"))

        .def("get",
             [](const PersistentTreeMap& map, py::object k, py::object dflt) {
                 std::optional<MapEntry> e = map.find(toValue(k));
                 return e ? fromValue(e->value) : dflt;
             },
             py::arg("key"), py::arg("default") = py::none())

        .def("first",
             [](const PersistentTreeMap& map) {
                 MapEntry e = map.first();
                 return py::make_tuple(fromValue(e.key), fromValue(e.value));
             },
             "Entry with the smallest key; raises IllegalStateError when empty.")

        .def("last",
             [](const PersistentTreeMap& map) {
                 MapEntry e = map.last();
                 return py::make_tuple(fromValue(e.key), fromValue(e.value));
             },
             "Entry with the largest key; raises IllegalStateError when empty.")

        .def("subseq",
             [](const PersistentTreeMap& map, py::object lower, py::object upper,
                bool lowerInclusive, bool upperInclusive) {
                 return entryList(map.subseq(toBound(lower, lowerInclusive), toBound(upper, upperInclusive)));
             },
             py::arg("lower") = py::none(), py::arg("upper") = py::none(),
             py::arg("lower_inclusive") = true, py::arg("upper_inclusive") = true,
             "Entries with keys within bounds, ascending. None leaves a side open.")

        .def("rsubseq",
             [](const PersistentTreeMap& map, py::object lower, py::object upper,
                bool lowerInclusive, bool upperInclusive) {
                 return entryList(map.rsubseq(toBound(lower, lowerInclusive), toBound(upper, upperInclusive)));
             },
             py::arg("lower") = py::none(), py::arg("upper") = py::none(),
             py::arg("lower_inclusive") = true, py::arg("upper_inclusive") = true,
             "Entries with keys within bounds, descending.")

        .def("__getitem__",
             [](const PersistentTreeMap& map, py::object k) {
                 std::optional<MapEntry> e = map.find(toValue(k));
                 if (!e) throw py::key_error(py::str(k));
                 return fromValue(e->value);
             },
             py::arg("key"))

        .def("__contains__", [](const PersistentTreeMap& map, py::object k) { return map.contains(toValue(k)); },
             py::arg("key"))
        .def("__iter__", [](const PersistentTreeMap& map) { return SeqIterator(map.keys()); })
        .def("__reversed__",
             [](const PersistentTreeMap& map) {
                 return SeqIterator(map.keyRange(std::nullopt, std::nullopt, false));
             })
        .def("keys", [](const PersistentTreeMap& map) { return valueList(map.keys()); })
        .def("values", [](const PersistentTreeMap& map) { return valueList(map.vals()); })
        .def("items", [](const PersistentTreeMap& map) { return entryList(map.seq()); });
    addValueProtocol(sortedMap);

    //=========================================================================
    // SortedSet
    //=========================================================================

    py::class_<PersistentTreeSet> sortedSet(m, "SortedSet");
    sortedSet
        .def(py::init<>(), "Create an empty SortedSet ordered by the default comparator")
        .def(py::init([](py::iterable items) {
                 PersistentTreeSet set;
                 for (py::handle item : items) {
                     set = set.conj(toValue(item));
                 }
                 return set;
             }),
             py::arg("items"))

        .def("conj", [](const PersistentTreeSet& s, py::object x) { return s.conj(toValue(x)); },
             py::arg("x"))
        .def("disj", [](const PersistentTreeSet& s, py::object x) { return s.disj(toValue(x)); },
             py::arg("x"))
        .def("first", [](const PersistentTreeSet& s) { return fromValue(s.first()); })
        .def("last", [](const PersistentTreeSet& s) { return fromValue(s.last()); })

        .def("subseq",
             [](const PersistentTreeSet& s, py::object lower, py::object upper,
                bool lowerInclusive, bool upperInclusive) {
                 return valueList(s.subseq(toBound(lower, lowerInclusive), toBound(upper, upperInclusive)));
             },
             py::arg("lower") = py::none(), py::arg("upper") = py::none(),
             py::arg("lower_inclusive") = true, py::arg("upper_inclusive") = true)

        .def("rsubseq",
             [](const PersistentTreeSet& s, py::object lower, py::object upper,
                bool lowerInclusive, bool upperInclusive) {
                 return valueList(s.rsubseq(toBound(lower, lowerInclusive), toBound(upper, upperInclusive)));
             },
             py::arg("lower") = py::none(), py::arg("upper") = py::none(),
             py::arg("lower_inclusive") = true, py::arg("upper_inclusive") = true)

        .def("__contains__", [](const PersistentTreeSet& s, py::object x) { return s.contains(toValue(x)); },
             py::arg("x"))
        .def("__iter__", [](const PersistentTreeSet& s) { return SeqIterator(s.seq()); })
        .def("__reversed__", [](const PersistentTreeSet& s) { return SeqIterator(s.reverseSeq()); });
    addValueProtocol(sortedSet);

    //=========================================================================
    // Generic capability protocol
    //=========================================================================

    m.def("count", [](py::object coll) { return count(toValue(coll)); }, py::arg("coll"));
    m.def("conj", [](py::object coll, py::object x) { return fromValue(conj(toValue(coll), toValue(x))); },
          py::arg("coll"), py::arg("x"));
    m.def("nth", [](py::object coll, int64_t idx) { return fromValue(nth(toValue(coll), idx)); },
          py::arg("coll"), py::arg("index"));
    m.def("get",
          [](py::object coll, py::object key, py::object dflt) {
              std::optional<MapEntry> e = find(toValue(coll), toValue(key));
              return e ? fromValue(e->value) : dflt;
          },
          py::arg("coll"), py::arg("key"), py::arg("default") = py::none());

    m.attr("__version__") = "1.0.0";
}

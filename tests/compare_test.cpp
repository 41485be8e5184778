// Tests for the structural comparator and its divergence messages
#include <cmath>
#include <gtest/gtest.h>
#include "deepeq/compare.hpp"

using namespace deepeq;

class CompareTest : public ::testing::Test {
protected:
    void SetUp() override {
        types.declare("(types"
                      "  (record :name AB :fields [(field :name A :type i64) (field :name B :type i64)])"
                      "  (record :name Order :fields [(field :name Id :type string)"
                      "                               (field :name Items :type (seq (map string f64)))"
                      "                               (field :name Owner :type (ptr AB))"
                      "                               (field :name Meta :type any)]))");
    }

    CompareResult run(const value* a, const value* b){ return Comparator(types, CompareOptions{}).compare(a, b); }
    std::string message(const value* a, const value* b){ return run(a, b).message; }

    TypeContext types;
    ValueContext vals{types};
};

TEST_F(CompareTest, ReflexiveForAcyclicValues){
    const char* order = "{:Id \"o-1\" :Items [{\"x\" 1.5} {\"y\" 2.0}] :Owner {:A 1 :B 2} :Meta #u16 7}";
    value* v = vals.read("Order", order);
    EXPECT_TRUE(run(v, v).equal);
    EXPECT_TRUE(run(v, vals.read("Order", order)).equal);
    EXPECT_TRUE(run(nullptr, nullptr).equal);
    EXPECT_EQ(run(v, v).message, "");
    EXPECT_FALSE(run(v, v).divergence.has_value());
}

TEST_F(CompareTest, RecordFieldDivergence){
    auto r = run(vals.read("AB", "{:A 1 :B 2}"), vals.read("AB", "{:A 1 :B 3}"));
    ASSERT_FALSE(r.equal);
    EXPECT_EQ(r.message, "values.B are not equal, where in x is 2 but in y is 3");
    const Divergence& d = *r.divergence;
    EXPECT_EQ(d.kind, DivergenceKind::ValueMismatch);
    EXPECT_EQ(d.first, "2");
    EXPECT_EQ(d.second, "3");
    ASSERT_EQ(d.path.size(), 1u);
    EXPECT_EQ(d.path[0].kind, PathSegment::Kind::Field);
    EXPECT_EQ(d.path[0].label, "B");
    EXPECT_EQ(d.depth, 1);
}

TEST_F(CompareTest, ArrayDivergence){
    TypeId arr = types.parse_type("(array :elem i64 :size 3)");
    EXPECT_EQ(message(vals.read(arr, "[1 2 3]"), vals.read(arr, "[1 5 3]")),
              "values[1] are not equal, where in x is 2 but in y is 5");
}

TEST_F(CompareTest, InvalidArrayChild){
    TypeId arr = types.parse_type("(array :elem i64 :size 2)");
    value* a = vals.make_array(arr, {vals.make_i64(1), vals.make_i64(2)});
    value* b = vals.make_array(arr, {vals.make_i64(1), nullptr});
    auto r = run(a, b);
    EXPECT_EQ(r.message, "values[1] in y is nil but in x is not");
    EXPECT_EQ(r.divergence->side, Side::Second);
}

TEST_F(CompareTest, MappingValueDivergence){
    TypeId m = types.parse_type("(map string i64)");
    EXPECT_EQ(message(vals.read(m, "{\"k\" 1}"), vals.read(m, "{\"k\" 2}")),
              "values[k] are not equal, where in x is 1 but in y is 2");
}

TEST_F(CompareTest, MappingLengthCheckedBeforeKeys){
    TypeId m = types.parse_type("(map string i64)");
    auto r = run(vals.read(m, "{\"k\" 1}"), vals.read(m, "{}"));
    EXPECT_EQ(r.divergence->kind, DivergenceKind::LengthMismatch);
    EXPECT_EQ(r.message, "values do not have the same length, where in x is 1 but in y is 0");
}

TEST_F(CompareTest, MappingKeyMissingInSecond){
    TypeId m = types.parse_type("(map string i64)");
    auto r = run(vals.read(m, "{\"a\" 1}"), vals.read(m, "{\"b\" 1}"));
    EXPECT_EQ(r.divergence->kind, DivergenceKind::KeyMissing);
    EXPECT_EQ(r.divergence->side, Side::Second);
    EXPECT_EQ(r.message, "values[a] is missing in y");
}

TEST_F(CompareTest, MappingFollowsFirstSideOrder){
    TypeId m = types.parse_type("(map string i64)");
    EXPECT_EQ(message(vals.read(m, "{\"a\" 1 \"b\" 2}"), vals.read(m, "{\"b\" 8 \"a\" 9}")),
              "values[a] are not equal, where in x is 1 but in y is 9");
}

TEST_F(CompareTest, NaNKeysAreMissingInFirst){
    TypeId m = types.parse_type("(map f64 i64)");
    value* a = vals.make_mapping(m);
    value* b = vals.make_mapping(m);
    vals.insert(a, vals.make_f64(NAN), vals.make_i64(1));
    vals.insert(b, vals.make_f64(NAN), vals.make_i64(1));
    auto r = run(a, b);
    EXPECT_EQ(r.divergence->kind, DivergenceKind::KeyMissing);
    EXPECT_EQ(r.divergence->side, Side::First);
    EXPECT_EQ(r.message, "values[NaN] is missing in x");
}

TEST_F(CompareTest, NaNLeafNeverEqual){
    value* nan = vals.make_f64(NAN);
    auto self = run(nan, nan);
    EXPECT_EQ(self.divergence->kind, DivergenceKind::NaNDivergence);
    EXPECT_EQ(self.message, "values in x is NaN float");
    auto second = run(vals.make_f64(1.0), vals.read("f64", "##NaN"));
    EXPECT_EQ(second.divergence->side, Side::Second);
    EXPECT_EQ(second.message, "values in y is NaN float");
}

TEST_F(CompareTest, NilSequenceVersusEmpty){
    TypeId s = types.parse_type("(seq i64)");
    auto r = run(vals.read(s, "nil"), vals.read(s, "[]"));
    EXPECT_EQ(r.divergence->kind, DivergenceKind::AbsenceMismatch);
    EXPECT_EQ(r.divergence->side, Side::First);
    EXPECT_EQ(r.message, "values in x is nil but in y is not");
    EXPECT_TRUE(run(vals.read(s, "nil"), vals.read(s, "nil")).equal);
    EXPECT_EQ(message(vals.read(s, "[]"), vals.read(s, "nil")), "values in y is nil but in x is not");
}

TEST_F(CompareTest, NilMappingVersusEmpty){
    TypeId m = types.parse_type("(map string i64)");
    EXPECT_EQ(message(vals.read(m, "{}"), vals.read(m, "nil")), "values in y is nil but in x is not");
}

TEST_F(CompareTest, SequenceLengthMismatch){
    TypeId s = types.parse_type("(seq i64)");
    auto r = run(vals.read(s, "[1 2]"), vals.read(s, "[1 2 3]"));
    EXPECT_EQ(r.message, "values do not have the same length, where in x is 2 but in y is 3");
    EXPECT_EQ(r.divergence->first, "2");
    EXPECT_EQ(r.divergence->second, "3");
}

TEST_F(CompareTest, SharedStorageShortcutsEvenWithNaN){
    value* s = vals.read("(seq f64)", "[##NaN 1.0 2.0]");
    EXPECT_TRUE(run(vals.slice(s, 0, 2), vals.slice(s, 0, 2)).equal);
    EXPECT_FALSE(run(vals.slice(s, 0, 2), vals.read("(seq f64)", "[##NaN 1.0]")).equal);

    value* m = vals.read("(map string f64)", "{\"n\" ##NaN}");
    EXPECT_TRUE(run(m, vals.share(m)).equal);
}

TEST_F(CompareTest, HiddenDynamicTypeMismatch){
    TypeId any = types.get_dynamic();
    auto r = run(vals.read(any, "1"), vals.read(any, "\"1\""));
    EXPECT_EQ(r.divergence->kind, DivergenceKind::TypeMismatch);
    EXPECT_EQ(r.message, "values(Interface) has different types, where in x is i64 but in y is string");
    ASSERT_EQ(r.divergence->path.size(), 1u);
    EXPECT_EQ(r.divergence->path[0].kind, PathSegment::Kind::Interface);
}

TEST_F(CompareTest, DynamicNilness){
    TypeId any = types.get_dynamic();
    EXPECT_TRUE(run(vals.nil_dynamic(any), vals.nil_dynamic(any)).equal);
    EXPECT_EQ(message(vals.nil_dynamic(any), vals.read(any, "1")), "values in x is nil but in y is not");
}

TEST_F(CompareTest, ReferencesCompareTargets){
    value* a = vals.read("(ptr AB)", "{:A 1 :B 2}");
    EXPECT_TRUE(run(a, vals.read("(ptr AB)", "{:A 1 :B 2}")).equal);
    EXPECT_EQ(message(a, vals.read("(ptr AB)", "{:A 1 :B 7}")),
              "values(Pointer).B are not equal, where in x is 2 but in y is 7");
    EXPECT_EQ(message(vals.read("(ptr AB)", "nil"), a), "values(Pointer) in x is nil but in y is not");
    EXPECT_TRUE(run(vals.read("(ptr AB)", "nil"), vals.read("(ptr AB)", "nil")).equal);
}

TEST_F(CompareTest, CallablesEqualOnlyWhenUnset){
    TypeId fn = types.parse_type("(fn-type :params [] :ret i64)");
    callable_fn body = [](const std::vector<const value*>&) -> const value* { return nullptr; };
    value* f = vals.make_callable(fn, body);
    EXPECT_TRUE(run(vals.nil_callable(fn), vals.nil_callable(fn)).equal);
    EXPECT_EQ(message(f, f), "values has different callables");
    EXPECT_EQ(run(f, vals.nil_callable(fn)).divergence->kind, DivergenceKind::CallableDivergence);
}

TEST_F(CompareTest, EntryGuard){
    value* v = vals.make_i64(1);
    auto r = run(nullptr, v);
    EXPECT_EQ(r.message, "x is nil while y is not");
    EXPECT_TRUE(r.divergence->at_entry);
    EXPECT_EQ(message(v, nullptr), "y is nil while x is not");
    EXPECT_EQ(message(v, vals.make_string("1")), "values have different types, where in x is i64 but in y is string");
    EXPECT_EQ(message(vals.read("(seq i64)", "[]"), vals.read("(seq i32)", "[]")),
              "values have different types, where in x is []i64 but in y is []i32");
}

TEST_F(CompareTest, NestedPathIsOutermostFirst){
    const char* a = "{:Id \"o\" :Items [{\"x\" 1.5} {\"y\" 2.0}] :Owner {:A 1 :B 2}}";
    const char* b = "{:Id \"o\" :Items [{\"x\" 1.5} {\"y\" 2.5}] :Owner {:A 1 :B 2}}";
    auto r = run(vals.read("Order", a), vals.read("Order", b));
    EXPECT_EQ(r.message, "values.Items[1][y] are not equal, where in x is 2 but in y is 2.5");
    EXPECT_EQ(format_path(r.divergence->path), ".Items[1][y]");
    EXPECT_EQ(r.divergence->depth, 3);
}

TEST_F(CompareTest, FirstDivergenceWins){
    auto r = run(vals.read("AB", "{:A 1 :B 2}"), vals.read("AB", "{:A 5 :B 6}"));
    EXPECT_EQ(r.divergence->path[0].label, "A");
}

TEST_F(CompareTest, LeafModes){
    value* pz = vals.make_f64(0.0);
    value* nz = vals.make_f64(-0.0);
    CompareOptions typed;
    typed.leaf_mode = LeafMode::Typed;
    EXPECT_EQ(run(pz, nz).message, "values are not equal, where in x is 0 but in y is -0");
    EXPECT_TRUE(Comparator(types, typed).compare(pz, nz).equal);
    EXPECT_FALSE(Comparator(types, typed).compare(vals.make_i64(1), vals.make_i64(2)).equal);
    EXPECT_EQ(Comparator(types, typed).compare(vals.make_string("a"), vals.make_string("b")).message,
              "values are not equal, where in x is a but in y is b");
}

TEST_F(CompareTest, CustomWording){
    CompareOptions opts;
    opts.wording = Wording{"got", "want", "have"};
    auto r = Comparator(types, opts).compare(vals.read("AB", "{:A 1}"), vals.read("AB", "{:A 2}"));
    EXPECT_EQ(r.message, "got.A are not equal, where in want is 1 but in have is 2");
    EXPECT_EQ(Comparator(types, opts).compare(nullptr, vals.make_i64(0)).message, "want is nil while have is not");
}

TEST_F(CompareTest, ConvenienceFunctions){
    value* a = vals.read("AB", "{:A 1 :B 2}");
    value* b = vals.read("AB", "{:A 1 :B 2}");
    EXPECT_TRUE(deep_equal(types, a, b));
    EXPECT_FALSE(explain(types, a, b).has_value());
    value* c = vals.read("AB", "{:A 1 :B 3}");
    EXPECT_FALSE(deep_equal(types, a, c));
    EXPECT_EQ(explain(types, a, c).value_or(""), "values.B are not equal, where in x is 2 but in y is 3");
    EXPECT_FALSE(compare(types, a, c).equal);
}

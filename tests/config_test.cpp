// Tests for environment-driven comparison options
#include <gtest/gtest.h>
#include "deepeq/compare.hpp"
#include "test_env.hpp"

using namespace deepeq;

TEST(Config, DefaultsWithoutEnvironment){
    ScopedEnv leaf("DEEPEQ_LEAF_COMPARE", "");
    ScopedEnv json("DEEPEQ_DIAG_JSON", "");
    ScopedEnv walk("DEEPEQ_DEBUG_WALK", "");
    CompareOptions o = CompareOptions::from_env();
    EXPECT_EQ(o.leaf_mode, LeafMode::Rendering);
    EXPECT_FALSE(o.emit_json);
    EXPECT_FALSE(o.trace);
    EXPECT_EQ(o.wording.root, "values");
    EXPECT_EQ(o.wording.first_name, "x");
    EXPECT_EQ(o.wording.second_name, "y");
}

TEST(Config, FlagsFromEnvironment){
    ScopedEnv leaf("DEEPEQ_LEAF_COMPARE", "typed");
    ScopedEnv json("DEEPEQ_DIAG_JSON", "1");
    ScopedEnv walk("DEEPEQ_DEBUG_WALK", "y");
    CompareOptions o = CompareOptions::from_env();
    EXPECT_EQ(o.leaf_mode, LeafMode::Typed);
    EXPECT_TRUE(o.emit_json);
    EXPECT_TRUE(o.trace);
}

TEST(Config, UnrecognizedValuesFallBack){
    ScopedEnv leaf("DEEPEQ_LEAF_COMPARE", "fuzzy");
    ScopedEnv json("DEEPEQ_DIAG_JSON", "0");
    testing::internal::CaptureStderr();
    CompareOptions o = CompareOptions::from_env();
    std::string warned = testing::internal::GetCapturedStderr();
    EXPECT_EQ(o.leaf_mode, LeafMode::Rendering);
    EXPECT_FALSE(o.emit_json);
    EXPECT_NE(warned.find("DEEPEQ_LEAF_COMPARE=fuzzy"), std::string::npos);
}

TEST(Config, ConvenienceHelpersHonorLeafMode){
    TypeContext types;
    ValueContext vals(types);
    value* pz = vals.make_f64(0.0);
    value* nz = vals.make_f64(-0.0);
    {
        ScopedEnv leaf("DEEPEQ_LEAF_COMPARE", "typed");
        EXPECT_TRUE(deep_equal(types, pz, nz));
    }
    {
        ScopedEnv leaf("DEEPEQ_LEAF_COMPARE", "rendering");
        EXPECT_FALSE(deep_equal(types, pz, nz));
    }
}

TEST(Config, DebugWalkTraces){
    TypeContext types;
    ValueContext vals(types);
    CompareOptions opts;
    opts.trace = true;
    value* s = vals.read("(seq i64)", "[1 2]");
    testing::internal::CaptureStderr();
    EXPECT_TRUE(Comparator(types, opts).compare(s, vals.slice(s, 0, 2)).equal);
    std::string trace = testing::internal::GetCapturedStderr();
    EXPECT_NE(trace.find("[dbg][walk] depth=0 type=[]i64"), std::string::npos);
    EXPECT_NE(trace.find("[dbg][shortcut]"), std::string::npos);
}

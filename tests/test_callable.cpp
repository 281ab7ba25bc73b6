#include <gtest/gtest.h>

#include "core/callable.hpp"

#include <stdexcept>

using namespace memento;
using core::CallableIdentity;

TEST(CallableIdentity, functionPrefix) {
    CallableIdentity id{"lib.test_cache", "", "a_function"};
    EXPECT_EQ(id.prefix(), "lib.test_cache:a_function:");
}

TEST(CallableIdentity, methodPrefix) {
    CallableIdentity id{"lib.test_cache", "A_Class", "a_method"};
    EXPECT_EQ(id.prefix(), "lib.test_cache:A_Class.a_method:");
}

TEST(CallableIdentity, staticMethodHasNoType) {
    CallableIdentity id{"lib.test_cache", "", "a_staticmethod"};
    EXPECT_EQ(id.prefix(), "lib.test_cache:a_staticmethod:");
}

TEST(CallableIdentity, qualifiedModuleDoesNotCollideWithType) {
    CallableIdentity function_in_module{"lib.A_Class", "", "f"};
    CallableIdentity method_on_type{"lib", "A_Class", "f"};
    EXPECT_NE(function_in_module.prefix(), method_on_type.prefix());
}

TEST(CallableIdentity, prefixIsNotLeadingSubstringOfOtherCallable) {
    auto f = CallableIdentity{"m", "", "f"}.prefix();
    auto f2 = CallableIdentity{"m", "", "f2"}.prefix();
    EXPECT_NE(f2.rfind(f, 0), 0u);
}

TEST(CallableIdentity, malformedComponentsThrow) {
    EXPECT_THROW((CallableIdentity{"m", "", ""}.validate()), std::invalid_argument);
    EXPECT_THROW((CallableIdentity{"", "", "f"}.validate()), std::invalid_argument);
    EXPECT_THROW((CallableIdentity{"m:x", "", "f"}.validate()), std::invalid_argument);
    EXPECT_THROW((CallableIdentity{"m", "A.B", "f"}.validate()), std::invalid_argument);
    EXPECT_THROW((CallableIdentity{"m", "", "f:g"}.validate()), std::invalid_argument);
    EXPECT_NO_THROW((CallableIdentity{"m.sub", "A", "f"}.validate()));
}

TEST(CallableInfo, computesPrefixOnce) {
    core::CallableInfo info({"mod", "Type", "fn"}, core::Signature{{"self"}, {"x"}}, 0);
    EXPECT_EQ(info.prefix(), "mod:Type.fn:");
    EXPECT_EQ(info.context_index(), 0u);
    EXPECT_EQ(info.signature().size(), 2u);
}

TEST(CallableInfo, contextIndexOutOfRangeThrows) {
    EXPECT_THROW(core::CallableInfo({"mod", "", "fn"}, core::Signature{{"x"}}, 1),
                 std::invalid_argument);
}

TEST(CallableInfo, invalidIdentityThrows) {
    EXPECT_THROW(core::CallableInfo({"mod", "", "a.b"}, core::Signature{}), std::invalid_argument);
}

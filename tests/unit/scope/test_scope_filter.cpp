//
// Created by gregorian-rayne on 02/11/26.
//

#include "covscope/scope/scope_filter.hpp"

#include <gtest/gtest.h>

namespace covscope::scope
{
    namespace {

        ScopeQuery packages(std::initializer_list<std::string> values) {
            ScopeQuery query;
            query.target_packages = values;
            return query;
        }

        ScopeQuery classes(std::initializer_list<std::string> values) {
            ScopeQuery query;
            query.target_classes = values;
            return query;
        }

    }  // namespace

    TEST(ScopeFilterTest, NoTargetsIncludesEverything) {
        const ScopeFilter filter{ScopeQuery{}};

        EXPECT_TRUE(filter.is_included("com.x.Foo"));
        EXPECT_TRUE(filter.is_included("Standalone"));
    }

    TEST(ScopeFilterTest, ModulesDoNotFilterClasses) {
        ScopeQuery query;
        query.target_modules = {"core"};
        const ScopeFilter filter(query);

        EXPECT_TRUE(filter.is_included("com.other.Bar"));
    }

    TEST(ScopeFilterTest, BuiltinExclusionsApplyWithoutTargets) {
        const ScopeFilter filter{ScopeQuery{}};

        EXPECT_FALSE(filter.is_included("com.x.generated.FooMapperImpl"));
        EXPECT_FALSE(filter.is_included("com.x.dto.UserDto"));
        EXPECT_FALSE(filter.is_included("com.x.dtos.UserDto"));
        EXPECT_FALSE(filter.is_included("com.x.model.User"));
        EXPECT_FALSE(filter.is_included("com.x.models.User"));
        EXPECT_FALSE(filter.is_included("com.x.exception.NotFound"));
        EXPECT_FALSE(filter.is_included("com.x.exceptions.NotFound"));
    }

    TEST(ScopeFilterTest, BuiltinExclusionsAreCaseInsensitive) {
        const ScopeFilter filter{ScopeQuery{}};

        EXPECT_FALSE(filter.is_included("com.x.Generated.Foo"));
        EXPECT_FALSE(filter.is_included("com.x.DTO.Foo"));
    }

    TEST(ScopeFilterTest, BuiltinExclusionsMatchWholeSegments) {
        const ScopeFilter filter{ScopeQuery{}};

        EXPECT_TRUE(filter.is_included("com.x.modelling.Planner"));
        EXPECT_TRUE(filter.is_included("com.x.service.ExceptionTranslator"));
        EXPECT_TRUE(filter.is_included("com.x.UserDtoMapper"));
    }

    TEST(ScopeFilterTest, PackagePrefixIncludes) {
        const ScopeFilter filter(packages({"com.x"}));

        EXPECT_TRUE(filter.is_included("com.x.Foo"));
        EXPECT_TRUE(filter.is_included("com.x.sub.Baz"));
        EXPECT_FALSE(filter.is_included("com.y.Bar"));
    }

    TEST(ScopeFilterTest, QualifiedClassTarget) {
        const ScopeFilter filter(classes({"com.x.service.UserService"}));

        EXPECT_TRUE(filter.is_included("com.x.service.UserService"));
        EXPECT_FALSE(filter.is_included("com.x.service.OrderService"));
    }

    TEST(ScopeFilterTest, SimpleClassTargetMatchesLastSegment) {
        const ScopeFilter filter(classes({"UserService"}));

        EXPECT_TRUE(filter.is_included("com.x.service.UserService"));
        EXPECT_TRUE(filter.is_included("UserService"));
        EXPECT_FALSE(filter.is_included("com.x.service.AdminUserService"));
        EXPECT_FALSE(filter.is_included("com.x.service.UserServiceImpl"));
    }

    TEST(ScopeFilterTest, PackagesAndClassesCombine) {
        ScopeQuery query;
        query.target_packages = {"com.x.api"};
        query.target_classes = {"AuthController"};
        const ScopeFilter filter(query);

        EXPECT_TRUE(filter.is_included("com.x.api.Router"));
        EXPECT_TRUE(filter.is_included("com.y.web.AuthController"));
        EXPECT_FALSE(filter.is_included("com.y.web.HomeController"));
    }

    TEST(ScopeFilterTest, ExclusionOverridesExplicitClassTarget) {
        const ScopeFilter filter(classes({"com.x.generated.Foo", "Foo"}));

        EXPECT_FALSE(filter.is_included("com.x.generated.Foo"));
        EXPECT_TRUE(filter.is_included("com.x.core.Foo"));
    }

    TEST(ScopeFilterTest, DecisionIsDeterministic) {
        const ScopeFilter filter(packages({"com.x"}));

        for (const auto* name : {"com.x.Foo", "com.y.Bar", "com.x.dto.Foo"}) {
            EXPECT_EQ(filter.is_included(name), filter.is_included(name));
            EXPECT_EQ(filter.is_included(name), is_in_scope(name, packages({"com.x"})));
        }
    }

    TEST(ScopeFilterTest, CreateWithExtraPatterns) {
        const auto filter = ScopeFilter::create(ScopeQuery{}, {R"(\.fixtures\.)"});

        ASSERT_TRUE(filter.is_ok());
        EXPECT_EQ(filter.value().exclusion_count(), builtin_exclusions().size() + 1);
        EXPECT_FALSE(filter.value().is_included("com.x.fixtures.Sample"));
        EXPECT_FALSE(filter.value().is_included("com.x.dto.Sample"));
        EXPECT_TRUE(filter.value().is_included("com.x.Sample"));
    }

    TEST(ScopeFilterTest, CreateWithoutBuiltins) {
        const auto filter = ScopeFilter::create(ScopeQuery{}, {}, false);

        ASSERT_TRUE(filter.is_ok());
        EXPECT_EQ(filter.value().exclusion_count(), 0u);
        EXPECT_TRUE(filter.value().is_included("com.x.dto.UserDto"));
    }

    TEST(ScopeFilterTest, CreateRejectsBadPattern) {
        const auto filter = ScopeFilter::create(ScopeQuery{}, {"(unclosed"});

        ASSERT_TRUE(filter.is_err());
        EXPECT_EQ(filter.error().code(), ErrorCode::ConfigError);
    }

    TEST(ScopeFilterTest, MatchesExclusionIgnoresTargets) {
        const ScopeFilter filter(packages({"com.x"}));

        EXPECT_TRUE(filter.matches_exclusion("com.x.model.User"));
        EXPECT_FALSE(filter.matches_exclusion("com.y.Bar"));
    }

}  // namespace covscope::scope

#include <gtest/gtest.h>
#include "core/errors/schema_errors.hpp"

using namespace agentic::core::errors;

// A dummy lookup that fails for unknown ids
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return SchemaError{ErrorKind::UnknownExtensionType, "Extension type 'x' is not registered."};
    }
    return std::string("vendor.Status");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "vendor.Status");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.kind, ErrorKind::UnknownExtensionType);
    EXPECT_EQ(error.message, "Extension type 'x' is not registered.");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, StatusOkCarriesNoError) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, TakeValueMovesOutOfResult) {
    Result<std::string> result = std::string("payload");
    const std::string taken = take_value(result);
    EXPECT_EQ(taken, "payload");
}

TEST(ErrorModelTest, KindsHaveDistinctNames) {
    EXPECT_EQ(to_string(ErrorKind::VariantMismatch), "variant_mismatch");
    EXPECT_EQ(to_string(ErrorKind::UnregisteredExtensionValue), "unregistered_extension_value");
    EXPECT_EQ(to_string(ErrorKind::UnknownExtensionType), "unknown_extension_type");
    EXPECT_EQ(to_string(ErrorKind::CorruptPayload), "corrupt_payload");
    EXPECT_EQ(to_string(ErrorKind::UnsupportedVersion), "unsupported_version");
    EXPECT_EQ(to_string(ErrorKind::RegistrationConflict), "registration_conflict");
}

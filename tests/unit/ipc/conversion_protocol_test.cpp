#include <gtest/gtest.h>

#include <fconv/ipc/conversion_protocol.h>

#include <string>

namespace fconv::test {

using ipc::makeParams;
using ipc::Operation;
using ipc::ParamMap;
using ipc::ParamValue;
using ipc::parseOperation;
using ipc::validateParams;

TEST(ConversionProtocolTest, CanonicalNamesRoundTrip) {
    for (auto op : ipc::ALL_OPERATIONS) {
        auto parsed = parseOperation(ipc::operationName(op));
        ASSERT_TRUE(parsed) << ipc::operationName(op);
        EXPECT_EQ(parsed.value(), op);
    }
}

TEST(ConversionProtocolTest, LegacyAliasesResolve) {
    EXPECT_EQ(parseOperation("pdf2png").value(), Operation::PdfToPng);
    EXPECT_EQ(parseOperation("png2jpg").value(), Operation::PngToJpg);
    EXPECT_EQ(parseOperation("jpg2png").value(), Operation::JpgToPng);
    EXPECT_EQ(parseOperation("img_grayscale").value(), Operation::ToGrayscale);
    EXPECT_EQ(parseOperation("img_resize").value(), Operation::Resize);
}

TEST(ConversionProtocolTest, UnknownOperationIsUnsupported) {
    for (const char* name : {"", "RESIZE", "png_to_webp", "resize "}) {
        auto parsed = parseOperation(name);
        ASSERT_FALSE(parsed) << "'" << name << "'";
        EXPECT_EQ(parsed.error().code, ErrorCode::UnsupportedOperation);
    }
}

TEST(ConversionProtocolTest, ResizeRequiresBothDimensions) {
    auto missingHeight = makeParams(Operation::Resize, {{"width", ParamValue{int64_t{10}}}});
    ASSERT_FALSE(missingHeight);
    EXPECT_EQ(missingHeight.error().code, ErrorCode::InvalidParameter);
    EXPECT_NE(missingHeight.error().message.find("height"), std::string::npos);

    auto none = makeParams(Operation::Resize, {});
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, ErrorCode::InvalidParameter);
}

TEST(ConversionProtocolTest, ResizeAcceptsIntegersAndNumericStrings) {
    ParamMap raw{{"height", ParamValue{std::string("240")}}, {"width", ParamValue{int64_t{320}}}};
    auto params = makeParams(Operation::Resize, raw);
    ASSERT_TRUE(params) << params.error().message;
    EXPECT_EQ(std::get<ipc::ResizeParams>(params.value()), (ipc::ResizeParams{320, 240}));
}

TEST(ConversionProtocolTest, ResizeRejectsNonPositiveAndMalformedValues) {
    const ParamValue bad[] = {ParamValue{int64_t{0}}, ParamValue{int64_t{-5}},
                              ParamValue{int64_t{70000}}, ParamValue{std::string("12px")},
                              ParamValue{std::string("")}, ParamValue{std::string(" 12")}};
    for (const auto& value : bad) {
        ParamMap raw{{"width", value}, {"height", ParamValue{int64_t{10}}}};
        auto params = makeParams(Operation::Resize, raw);
        ASSERT_FALSE(params);
        EXPECT_EQ(params.error().code, ErrorCode::InvalidParameter);
    }
}

TEST(ConversionProtocolTest, ParameterlessOperationsIgnoreExtraKeys) {
    ParamMap raw{{"width", ParamValue{int64_t{10}}}};
    for (auto op : {Operation::PdfToPng, Operation::PngToJpg, Operation::JpgToPng,
                    Operation::ToGrayscale}) {
        auto params = makeParams(op, raw);
        ASSERT_TRUE(params);
        EXPECT_TRUE(std::holds_alternative<ipc::NoParams>(params.value()));
    }
}

TEST(ConversionProtocolTest, ValidateRejectsMismatchedVariant) {
    auto r = validateParams(Operation::Resize, ipc::NoParams{});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidParameter);

    auto extra = validateParams(Operation::PngToJpg, ipc::ResizeParams{10, 10});
    ASSERT_FALSE(extra);
    EXPECT_EQ(extra.error().code, ErrorCode::InvalidParameter);

    auto zero = validateParams(Operation::Resize, ipc::ResizeParams{0, 10});
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidParameter);

    EXPECT_TRUE(validateParams(Operation::Resize, ipc::ResizeParams{1, 1}));
    EXPECT_TRUE(validateParams(Operation::ToGrayscale, ipc::NoParams{}));
}

TEST(ConversionProtocolTest, ErrorKindNamesAreStable) {
    EXPECT_STREQ(errorKindName(ErrorCode::DecodeError), "DecodeError");
    EXPECT_STREQ(errorKindName(ErrorCode::UnsupportedOperation), "UnsupportedOperationError");
    EXPECT_EQ(errorKindFromName("TimeoutError"), ErrorCode::Timeout);
    EXPECT_EQ(errorKindFromName("IOError"), ErrorCode::IOError);
    EXPECT_FALSE(errorKindFromName("NoSuchKind").has_value());
}

} // namespace fconv::test

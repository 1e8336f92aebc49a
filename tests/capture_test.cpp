//! # Capture Tests
//!
//! Tests for the capture path: recorded shapes, count patching, the depth
//! limit, length checks, structural misuse, producer failures and the
//! borrow policy.

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace shapebuf;
using namespace shapebuf::test;

namespace {

/// Replays `buffer` into an event log.
auto events_of(const Buffer& buffer) -> std::vector<std::string> {
    EventLog log;
    auto replayed = buffer.replay_into(log);
    EXPECT_TRUE(is_ok(replayed));
    return log.events;
}

/// A producer nesting `depth` sequences around a single integer.
auto nested(size_t depth) -> Buffer::Producer {
    return [depth](Serializer& s) -> Status {
        for (size_t i = 0; i < depth; ++i) {
            auto status = s.begin_seq(1);
            if (is_err(status)) {
                return status;
            }
        }
        auto status = s.serialize_i32(7);
        if (is_err(status)) {
            return status;
        }
        for (size_t i = 0; i < depth; ++i) {
            status = s.end_seq();
            if (is_err(status)) {
                return status;
            }
        }
        return ok();
    };
}

/// A value whose text is built while it is serialized.
struct Label {
    int32_t number = 0;

    [[nodiscard]] auto text() const -> std::string {
        return "label-number-" + std::to_string(number) + "-built-during-serialize";
    }
};

} // namespace

namespace shapebuf {

template <> struct Serialize<Label> {
    static auto serialize(const Label& label, Serializer& s) -> Status {
        std::string text = label.text();
        return serialize_value(text, s);
    }
};

} // namespace shapebuf

// ============================================================================
// Recorded Shapes
// ============================================================================

TEST(CaptureTest, ScalarValue) {
    auto captured = Buffer::capture(int32_t{42});
    ASSERT_TRUE(is_ok(captured));

    EXPECT_EQ(events_of(unwrap(captured)), std::vector<std::string>{"i32:42"});
    EXPECT_EQ(unwrap(captured).stats().tokens, 1u);
}

TEST(CaptureTest, StructRecordsFieldNames) {
    auto captured = Buffer::capture(Point{1, -2});
    ASSERT_TRUE(is_ok(captured));

    std::vector<std::string> expected = {"struct:Point(2)", "field:x", "i32:1",
                                         "field:y",         "i32:-2",  "end_struct"};
    EXPECT_EQ(events_of(unwrap(captured)), expected);
}

TEST(CaptureTest, OptionalAndNestedContainers) {
    std::map<std::string, std::vector<std::optional<int64_t>>> value = {
        {"a", {1, std::nullopt}},
        {"b", {}},
    };
    auto captured = Buffer::capture(value);
    ASSERT_TRUE(is_ok(captured));

    std::vector<std::string> expected = {
        "map(2)",  "str:a",  "seq(2)", "some", "i64:1",  "none",    "end_seq",
        "str:b",   "seq(0)", "end_seq", "end_map",
    };
    // Content was copied, so it is handed on as borrowed from the buffer
    std::vector<std::string> events = events_of(unwrap(captured));
    for (auto& event : events) {
        if (event.rfind("bstr:", 0) == 0) {
            event = "str:" + event.substr(5);
        }
    }
    EXPECT_EQ(events, expected);
}

TEST(CaptureTest, EnumVariants) {
    Message quit;
    Message color;
    color.kind = Message::Kind::Color;
    color.rgb = {1, 2, 3};

    EXPECT_EQ(events_of(unwrap(Buffer::capture(quit))),
              std::vector<std::string>{"unit_variant:Message::Quit#0"});

    std::vector<std::string> expected = {"tuple_variant:Message::Color#3(3)", "u8:1", "u8:2",
                                         "u8:3", "end_tuple_variant"};
    EXPECT_EQ(events_of(unwrap(Buffer::capture(color))), expected);
}

// ============================================================================
// Count Patching
// ============================================================================

TEST(CaptureTest, UnknownLengthIsPatched) {
    auto captured = Buffer::capture_with([](Serializer& s) -> Status {
        auto status = s.begin_seq(std::nullopt);
        for (int32_t i = 0; i < 3 && is_ok(status); ++i) {
            status = s.serialize_i32(i);
        }
        if (is_err(status)) {
            return status;
        }
        return s.end_seq();
    });
    ASSERT_TRUE(is_ok(captured));

    std::vector<std::string> expected = {"seq(3)", "i32:0", "i32:1", "i32:2", "end_seq"};
    EXPECT_EQ(events_of(unwrap(captured)), expected);
}

TEST(CaptureTest, WrongLengthHintIsCorrected) {
    auto captured = Buffer::capture_with([](Serializer& s) -> Status {
        auto status = s.begin_map(5);
        if (is_ok(status)) {
            status = s.serialize_str("k");
        }
        if (is_ok(status)) {
            status = s.serialize_bool(false);
        }
        if (is_err(status)) {
            return status;
        }
        return s.end_map();
    });
    ASSERT_TRUE(is_ok(captured));

    std::vector<std::string> expected = {"map(1)", "bstr:k", "bool:false", "end_map"};
    EXPECT_EQ(events_of(unwrap(captured)), expected);
}

// ============================================================================
// Depth Limit
// ============================================================================

TEST(CaptureTest, DefaultDepthLimitAccepted) {
    auto captured = Buffer::capture_with(nested(CaptureOptions::DEFAULT_MAX_DEPTH));
    ASSERT_TRUE(is_ok(captured));
    EXPECT_EQ(unwrap(captured).stats().tokens, CaptureOptions::DEFAULT_MAX_DEPTH + 1);
}

TEST(CaptureTest, DefaultDepthLimitExceeded) {
    auto captured = Buffer::capture_with(nested(CaptureOptions::DEFAULT_MAX_DEPTH + 1));
    ASSERT_TRUE(is_err(captured));

    const CaptureError& error = unwrap_err(captured);
    EXPECT_EQ(error.kind, CaptureError::Kind::DepthExceeded);
    EXPECT_EQ(error.max_depth, CaptureOptions::DEFAULT_MAX_DEPTH);
}

TEST(CaptureTest, ConfiguredDepthLimit) {
    CaptureOptions options;
    options.max_depth = 2;

    std::vector<std::vector<int32_t>> two_levels = {{1}, {2, 3}};
    EXPECT_TRUE(is_ok(Buffer::capture(two_levels, options)));

    std::vector<std::vector<std::vector<int32_t>>> three_levels = {{{1}}};
    auto captured = Buffer::capture(three_levels, options);
    ASSERT_TRUE(is_err(captured));
    EXPECT_EQ(unwrap_err(captured).kind, CaptureError::Kind::DepthExceeded);
}

TEST(CaptureTest, OptionalsCountTowardDepth) {
    CaptureOptions options;
    options.max_depth = 1;

    EXPECT_TRUE(is_ok(Buffer::capture(std::optional<int32_t>(5), options)));
    auto captured = Buffer::capture(std::optional<std::optional<int32_t>>(5), options);
    ASSERT_TRUE(is_err(captured));
    EXPECT_EQ(unwrap_err(captured).kind, CaptureError::Kind::DepthExceeded);
}

// ============================================================================
// Length Limit
// ============================================================================

TEST(CaptureTest, DeclaredLengthTooLarge) {
    auto captured = Buffer::capture_with([](Serializer& s) -> Status {
        size_t huge = static_cast<size_t>(std::numeric_limits<uint32_t>::max()) + 1;
        auto status = s.begin_seq(huge);
        if (is_err(status)) {
            return status;
        }
        return s.end_seq();
    });
    ASSERT_TRUE(is_err(captured));
    EXPECT_EQ(unwrap_err(captured).kind, CaptureError::Kind::LengthOverflow);
}

// ============================================================================
// Failures
// ============================================================================

TEST(CaptureTest, ProducerFailureIsReportedVerbatim) {
    auto captured = Buffer::capture_with([](Serializer& s) -> Status {
        auto status = s.begin_seq(2);
        if (is_err(status)) {
            return status;
        }
        return Error::custom("source went away");
    });
    ASSERT_TRUE(is_err(captured));

    const CaptureError& error = unwrap_err(captured);
    EXPECT_EQ(error.kind, CaptureError::Kind::SourceFailed);
    EXPECT_EQ(error.message, "source went away");
    EXPECT_EQ(error.source.code, ErrorCode::Custom);
    EXPECT_EQ(error.source.message, "source went away");
}

TEST(CaptureTest, ProducerErrorKeepsItsCode) {
    auto captured = Buffer::capture_with(
        [](Serializer&) -> Status { return Error::invalid_type("i32", "string"); });
    ASSERT_TRUE(is_err(captured));

    const CaptureError& error = unwrap_err(captured);
    EXPECT_EQ(error.kind, CaptureError::Kind::SourceFailed);
    EXPECT_EQ(error.source.code, ErrorCode::ShapeMismatch);
    EXPECT_EQ(error.source.expected, "string");
    EXPECT_EQ(error.source.found, "i32");
    EXPECT_EQ(error.message, error.source.message);
}

TEST(CaptureTest, FailureIsLatched) {
    CaptureOptions options;
    options.max_depth = 1;
    bool later_call_failed = false;

    auto captured = Buffer::capture_with(
        [&later_call_failed](Serializer& s) -> Status {
            auto status = s.begin_seq(1);
            if (is_ok(status)) {
                status = s.begin_seq(1);
            }
            // A producer that ignores the failure gets errors from then on
            later_call_failed = is_err(s.serialize_i32(1));
            return status;
        },
        options);

    EXPECT_TRUE(later_call_failed);
    ASSERT_TRUE(is_err(captured));
    EXPECT_EQ(unwrap_err(captured).kind, CaptureError::Kind::DepthExceeded);
}

TEST(CaptureTest, ErrorDisplay) {
    CaptureError error = CaptureError::depth_exceeded(4);
    EXPECT_EQ(error.to_string(),
              "capture failed (depth exceeded): nesting exceeds the maximum depth of 4");
}

// ============================================================================
// Structural Misuse
// ============================================================================

TEST(CaptureMisuseTest, SecondTopLevelValue) {
    EXPECT_THROW(Buffer::capture_with([](Serializer& s) -> Status {
                     (void)s.serialize_i32(1);
                     return s.serialize_i32(2);
                 }),
                 std::logic_error);
}

TEST(CaptureMisuseTest, MismatchedEnd) {
    EXPECT_THROW(Buffer::capture_with([](Serializer& s) -> Status {
                     (void)s.begin_map(std::nullopt);
                     return s.end_seq();
                 }),
                 std::logic_error);
}

TEST(CaptureMisuseTest, MapKeyWithoutValue) {
    EXPECT_THROW(Buffer::capture_with([](Serializer& s) -> Status {
                     (void)s.begin_map(1);
                     (void)s.serialize_str("orphan");
                     return s.end_map();
                 }),
                 std::logic_error);
}

TEST(CaptureMisuseTest, StructValueWithoutField) {
    EXPECT_THROW(Buffer::capture_with([](Serializer& s) -> Status {
                     (void)s.begin_struct("Point", 1);
                     return s.serialize_i32(1);
                 }),
                 std::logic_error);
}

TEST(CaptureMisuseTest, FieldOutsideStruct) {
    EXPECT_THROW(Buffer::capture_with([](Serializer& s) -> Status {
                     (void)s.begin_seq(1);
                     return s.serialize_field("x");
                 }),
                 std::logic_error);
}

TEST(CaptureMisuseTest, UnclosedContainer) {
    EXPECT_THROW(Buffer::capture_with([](Serializer& s) -> Status { return s.begin_seq(0); }),
                 std::logic_error);
}

TEST(CaptureMisuseTest, NothingSerialized) {
    EXPECT_THROW(Buffer::capture_with([](Serializer&) -> Status { return ok(); }),
                 std::logic_error);
}

// ============================================================================
// Borrow Policy
// ============================================================================

TEST(CaptureBorrowTest, AnchoredSourceIsBorrowed) {
    auto doc = std::make_shared<Document>(
        Document{"A title long enough to live on the heap", {"red", "green"}, "a note"});
    auto captured = Buffer::capture(doc);
    ASSERT_TRUE(is_ok(captured));

    const Buffer& buffer = unwrap(captured);
    EXPECT_EQ(buffer.stats().borrowed_entries, 4u);

    EventLog log;
    ASSERT_TRUE(is_ok(buffer.replay_into(log)));
    ASSERT_EQ(log.str_pointers.size(), 4u);
    EXPECT_EQ(log.str_pointers[0], doc->title.data());
    EXPECT_EQ(log.str_pointers[1], doc->tags[0].data());
    EXPECT_EQ(log.str_pointers[2], doc->tags[1].data());
    EXPECT_EQ(log.str_pointers[3], doc->note->data());
    EXPECT_EQ(log.anchors[0].get(), static_cast<const void*>(doc.get()));
}

TEST(CaptureBorrowTest, UnanchoredSourceIsCopied) {
    Document doc{"title", {"tag"}, std::nullopt};
    auto captured = Buffer::capture(doc);
    ASSERT_TRUE(is_ok(captured));

    BufferStats stats = unwrap(captured).stats();
    EXPECT_EQ(stats.borrowed_entries, 0u);

    EventLog log;
    ASSERT_TRUE(is_ok(unwrap(captured).replay_into(log)));
    ASSERT_EQ(log.str_pointers.size(), 2u);
    EXPECT_NE(log.str_pointers[0], doc.title.data());
}

TEST(CaptureBorrowTest, CopyPolicyCopiesAnchoredSource) {
    auto doc = std::make_shared<Document>(Document{"title", {"tag"}, std::nullopt});
    std::weak_ptr<Document> weak = doc;

    CaptureOptions options;
    options.borrow = BorrowPolicy::Copy;
    auto captured = Buffer::capture(doc, options);
    ASSERT_TRUE(is_ok(captured));
    EXPECT_EQ(unwrap(captured).stats().borrowed_entries, 0u);

    doc.reset();
    EXPECT_TRUE(weak.expired());
}

TEST(CaptureBorrowTest, TransientTextIsAlwaysCopied) {
    auto source = std::make_shared<const std::string>("transient");
    auto captured = Buffer::capture_with(
        [&source](Serializer& s) -> Status { return s.serialize_str(*source); }, {}, source);
    ASSERT_TRUE(is_ok(captured));
    EXPECT_EQ(unwrap(captured).stats().borrowed_entries, 0u);
    EXPECT_EQ(unwrap(captured).stats().owned_bytes, 9u);
}

TEST(CaptureBorrowTest, TextBuiltDuringSerializeIsCopied) {
    auto label = std::make_shared<const Label>(Label{41});
    auto captured = Buffer::capture(label);
    ASSERT_TRUE(is_ok(captured));

    const Buffer& buffer = unwrap(captured);
    EXPECT_EQ(buffer.stats().borrowed_entries, 0u);
    EXPECT_EQ(buffer.stats().owned_bytes, label->text().size());

    auto text = buffer.deserialize<std::string>();
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "label-number-41-built-during-serialize");
}

TEST(CaptureBorrowTest, OnlyContentInsideRegionsIsBorrowed) {
    auto source = std::make_shared<const std::string>("alpha beta gamma delta epsilon");
    SourceRegions regions;
    collect_regions(*source, regions);

    auto captured = Buffer::capture_with(
        [&source](Serializer& s) -> Status {
            auto status = s.begin_seq(2);
            if (is_ok(status)) {
                status = s.serialize_borrowed_str(std::string_view(*source).substr(6, 4), nullptr);
            }
            if (is_ok(status)) {
                std::string joined = *source + " and more text appended here";
                status = s.serialize_borrowed_str(joined, nullptr);
            }
            if (is_err(status)) {
                return status;
            }
            return s.end_seq();
        },
        {}, source, std::move(regions));
    ASSERT_TRUE(is_ok(captured));

    const Buffer& buffer = unwrap(captured);
    EXPECT_EQ(buffer.stats().borrowed_entries, 1u);

    EventLog log;
    ASSERT_TRUE(is_ok(buffer.replay_into(log)));
    ASSERT_EQ(log.str_pointers.size(), 2u);
    EXPECT_EQ(log.str_pointers[0], source->data() + 6);

    auto words = buffer.deserialize<std::vector<std::string>>();
    ASSERT_TRUE(is_ok(words));
    EXPECT_EQ(unwrap(words)[0], "beta");
    EXPECT_EQ(unwrap(words)[1], *source + " and more text appended here");
}

TEST(CaptureBorrowTest, AnchorWithoutRegionsCopies) {
    auto source = std::make_shared<const std::string>("an anchor alone does not allow borrowing");
    auto captured = Buffer::capture_with(
        [&source](Serializer& s) -> Status { return s.serialize_borrowed_str(*source, nullptr); },
        {}, source);
    ASSERT_TRUE(is_ok(captured));
    EXPECT_EQ(unwrap(captured).stats().borrowed_entries, 0u);
    EXPECT_EQ(unwrap(captured).stats().owned_bytes, source->size());
}

TEST(CaptureBorrowTest, ExplicitAnchorIsAlwaysBorrowed) {
    auto source = std::make_shared<const std::string>("explicitly anchored text");
    auto captured = Buffer::capture_with(
        [&source](Serializer& s) -> Status { return s.serialize_borrowed_str(*source, source); });
    ASSERT_TRUE(is_ok(captured));
    EXPECT_EQ(unwrap(captured).stats().borrowed_entries, 1u);
}

// ============================================================================
// Source Regions
// ============================================================================

TEST(SourceRegionsTest, MergesOverlappingRanges) {
    char storage[64] = {};
    SourceRegions regions;
    regions.add(storage + 10, 10);
    regions.add(storage, 12);
    regions.add(storage + 40, 8);
    regions.add(storage + 20, 5);
    regions.seal();

    EXPECT_EQ(regions.size(), 2u);
    EXPECT_TRUE(regions.contains(storage, 25));
    EXPECT_TRUE(regions.contains(storage + 42, 6));
    EXPECT_FALSE(regions.contains(storage + 20, 10));
    EXPECT_FALSE(regions.contains(storage + 30, 1));
}

TEST(SourceRegionsTest, EmptyContent) {
    char storage[8] = {};
    SourceRegions regions;
    regions.add(storage, sizeof(storage));
    regions.seal();

    EXPECT_TRUE(regions.contains(storage + 3, 0));
    EXPECT_FALSE(regions.contains(storage + 8, 0));
    EXPECT_FALSE(regions.contains(nullptr, 0));
}

TEST(SourceRegionsTest, ContainsRequiresSeal) {
    char storage[4] = {};
    SourceRegions regions;
    regions.add(storage, sizeof(storage));
    EXPECT_THROW((void)regions.contains(storage, 1), std::logic_error);
}

TEST(SourceRegionsTest, StandardContainersReportHeapText) {
    std::map<std::string, std::vector<std::string>> source = {
        {"a key long enough for the heap", {"an element long enough for the heap"}}};
    SourceRegions regions;
    collect_regions(source, regions);
    regions.seal();

    const auto& [key, values] = *source.begin();
    EXPECT_TRUE(regions.contains(key.data(), key.size()));
    EXPECT_TRUE(regions.contains(values[0].data(), values[0].size()));

    std::string elsewhere = "a string that is not part of the source";
    EXPECT_FALSE(regions.contains(elsewhere.data(), elsewhere.size()));
}

// tests/test_column_signature.cpp
#include "tests.hpp"

#include <cstdint>
#include <string>

#include "largecol/codec/data_reader.hpp"
#include "largecol/codec/data_serializer.hpp"
#include "largecol/layout/column_signature.hpp"
#include "largecol/layout/element_type.hpp"

using namespace largecol;
using namespace largecol::layout;

namespace {
    struct calendar_date {
        std::int32_t days;
    };

    struct with_pointer {
        const char* name;
    };
}

template <>
struct largecol::layout::element_traits<calendar_date> : opaque_element<calendar_date, 0x4441> {};

TEST_SUITE("layout/column_signature") {

    TEST_CASE("builtin descriptors carry kind and width") {
        CHECK(element_descriptor_of<std::int64_t>() == element_descriptor{ element_kind::i64, 0, 8 });
        CHECK(element_descriptor_of<double>() == element_descriptor{ element_kind::fp64, 0, 8 });
        CHECK(element_descriptor_of<char32_t>() == element_descriptor{ element_kind::char32, 0, 4 });
        CHECK(element_descriptor_of<bool>().width == sizeof(bool));
        CHECK(element_descriptor_of<calendar_date>() == element_descriptor{ element_kind::opaque, 0x4441, 4 });
    }

    TEST_CASE("bits types: pointers and unregistered structs are not") {
        static_assert(BitsType<std::int32_t>);
        static_assert(BitsType<calendar_date>);
        static_assert(!BitsType<int*>);
        static_assert(!BitsType<with_pointer>);
        static_assert(!BitsType<std::string>);
    }

    TEST_CASE("of<Ts...> keeps column order") {
        const auto sig = column_signature::of<std::int64_t, double, calendar_date>();
        REQUIRE(sig.size() == 3);
        CHECK(sig.column(1).kind == element_kind::i64);
        CHECK(sig.column(2).kind == element_kind::fp64);
        CHECK(sig.column(3).kind == element_kind::opaque);
        CHECK(sig.record_width() == 20);
        CHECK(sig.to_string() == "(i64, fp64, opaque#17473[4])");
        CHECK_THROWS_AS(sig.column(0), index_error);
        CHECK_THROWS_AS(sig.column(4), index_error);

        CHECK(sig != column_signature::of<double, std::int64_t, calendar_date>());
        CHECK(sig == column_signature::of<std::int64_t, double, calendar_date>());
    }

    TEST_CASE("validate rejects empty and malformed signatures") {
        CHECK_THROWS_AS(column_signature{}.validate(), validation_error);
        CHECK_THROWS_AS((column_signature{ element_descriptor{ element_kind::i32, 0, 0 } }.validate()), validation_error);
        CHECK_THROWS_AS((column_signature{ element_descriptor{ element_kind::undefined, 0, 4 } }.validate()), validation_error);
        CHECK_THROWS_AS((column_signature{ element_descriptor{ element_kind::opaque, 0, 4 } }.validate()), validation_error);
        CHECK_THROWS_AS((column_signature{ element_descriptor{ element_kind::u8, 3, 1 } }.validate()), validation_error);
        CHECK_NOTHROW(column_signature::of<std::uint8_t>().validate());
    }

    TEST_CASE("encode/decode") {
        const auto sig = column_signature::of<std::int16_t, float, calendar_date>();
        codec::data_serializer ds;
        sig.encode(ds);
        // header + prefix + count + 3 columns
        CHECK(ds.size() == 4 + 4 + 4 + 3 * 8);

        codec::data_reader reader(ds.view());
        const auto payload = reader.load_blob(codec::field_type::signature);
        REQUIRE(payload.has_value());
        const auto back = column_signature::decode(*payload);
        REQUIRE(back.has_value());
        CHECK(*back == sig);
    }

    TEST_CASE("decode rejects short, trailing and unknown-kind payloads") {
        codec::data_serializer ds;
        ds.append_word(std::uint32_t{2})
          .append_word(std::uint16_t{static_cast<std::uint16_t>(element_kind::i32)})
          .append_word(std::uint16_t{0})
          .append_word(std::uint32_t{4});
        CHECK_FALSE(column_signature::decode(ds.view()).has_value()); // second column missing

        codec::data_serializer one;
        one.append_word(std::uint32_t{1})
           .append_word(std::uint16_t{static_cast<std::uint16_t>(element_kind::i32)})
           .append_word(std::uint16_t{0})
           .append_word(std::uint32_t{4});
        CHECK(column_signature::decode(one.view()).has_value());
        one.append_word(std::uint16_t{0});
        CHECK_FALSE(column_signature::decode(one.view()).has_value()); // trailing bytes

        codec::data_serializer bad;
        bad.append_word(std::uint32_t{1})
           .append_word(std::uint16_t{999})
           .append_word(std::uint16_t{0})
           .append_word(std::uint32_t{4});
        CHECK_FALSE(column_signature::decode(bad.view()).has_value());
    }
}

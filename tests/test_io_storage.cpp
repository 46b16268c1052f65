#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <cl3/core/cliffor.hpp>
#include <cl3/io/format.hpp>
#include <cl3/io/storage.hpp>
#include <cl3/random.hpp>

#include "support/generators.hpp"

using namespace cl3::core;
using namespace cl3::io;

TEST_CASE("Single records use the full embedding") {
  std::array<double, kRecordSize> raw{};
  store(ODD(1, 2, 3, 4), raw);
  const std::array<double, kRecordSize> expected = {0, 1, 2, 3, 0, 0, 0, 4};
  CHECK(raw == expected);

  const Cliffor back = load(raw);
  CHECK(back.variant() == Variant::APS);
  CHECK(back == ODD(1, 2, 3, 4));
}

TEST_CASE("record_count") {
  CHECK(record_count(0) == 0);
  CHECK(record_count(16) == 2);
  CHECK_THROWS_AS(record_count(9), std::invalid_argument);
}

TEST_CASE("PackedBuffer pack and unpack") {
  auto gen = cl3::test_support::make_engine(71);
  std::vector<Cliffor> values;
  for (Variant v : kAllVariants) {
    values.push_back(cl3::sampling::random_of(v, 0.5, 2.0, gen));
  }

  const PackedBuffer buf = PackedBuffer::pack(values);
  REQUIRE(buf.size() == values.size());
  CHECK(buf.raw().size() == values.size() * kRecordSize);

  const std::vector<Cliffor> back = buf.unpack();
  REQUIRE(back.size() == values.size());
  for (std::size_t i = 0; i < values.size(); ++i) {
    CHECK(back[i] == values[i]);
    CHECK(back[i].variant() == Variant::APS);
  }
}

TEST_CASE("PackedBuffer element access") {
  PackedBuffer buf(3);
  CHECK(buf.size() == 3);
  CHECK_FALSE(buf.empty());
  CHECK(buf.at(2) == R(0));

  buf.set(1, H(1, 2, 3, 4));
  CHECK(buf.at(1) == H(1, 2, 3, 4));
  CHECK(buf.record(1)[kA23] == 2);

  buf.push_back(V3(7, 8, 9));
  CHECK(buf.size() == 4);
  CHECK(buf.at(3) == V3(7, 8, 9));

  CHECK_THROWS_AS(buf.at(4), std::out_of_range);
  CHECK_THROWS_AS(buf.set(4, R(1)), std::out_of_range);

  PackedBuffer empty;
  CHECK(empty.empty());
  CHECK(empty.size() == 0);
}

TEST_CASE("PackedBuffer from raw doubles") {
  const std::vector<double> raw = {1, 0, 0, 0, 0, 0, 0, 0, 0, 1, 2, 3, 0, 0, 0, 0};
  const PackedBuffer buf(raw);
  CHECK(buf.size() == 2);
  CHECK(buf.at(0) == R(1));
  CHECK(buf.at(1) == V3(1, 2, 3));

  const std::vector<double> bad(12, 0.0);
  CHECK_THROWS_AS(PackedBuffer{std::span<const double>(bad)}, std::invalid_argument);
}

TEST_CASE("PackedBuffer storage is SIMD aligned") {
  PackedBuffer buf(5);
  const auto address = reinterpret_cast<std::uintptr_t>(buf.raw().data());
  CHECK(address % AlignedAllocator<double>::alignment == 0);
}

#include <catch2/catch.hpp>

#include "drawcast/data_buffer.hpp"
#include "drawcast/outcome_types.hpp"
#include "test_helpers.hpp"

using namespace drawcast;
using drawcast::testing::BufferFromDigits;
using drawcast::testing::PeriodAt;

TEST_CASE("MakeOutcome derives label and bit from the digit", "[outcome]") {
  const auto big = MakeOutcome("1", 5);
  CHECK(big.label == Label::Big);
  CHECK(big.bit == 1);

  const auto small = MakeOutcome("2", 4);
  CHECK(small.label == Label::Small);
  CHECK(small.bit == 0);

  CHECK(Opposite(Label::Big) == Label::Small);
  CHECK(std::string(LabelName(Label::Small)) == "SMALL");

  CHECK_THROWS_AS(MakeOutcome("3", 10), std::invalid_argument);
  CHECK_THROWS_AS(MakeOutcome("3", -1), std::invalid_argument);
}

TEST_CASE("DataBuffer keeps the last ingested record at the head",
          "[buffer]") {
  DataBuffer buf(10);
  const auto added = buf.Ingest({MakeOutcome(PeriodAt(1), 3),
                                 MakeOutcome(PeriodAt(2), 8),
                                 MakeOutcome(PeriodAt(3), 1)});
  CHECK(added == 3);
  REQUIRE(buf.size() == 3);
  CHECK(buf.newest().period_id == PeriodAt(3));
  CHECK(buf.Digits() == std::vector<int>{1, 8, 3});
  CHECK(buf.Bits() == std::vector<int>{0, 1, 0});
  CHECK(buf.Digits(2) == std::vector<int>{1, 8});
}

TEST_CASE("Re-ingesting a present period changes nothing", "[buffer]") {
  DataBuffer buf(10);
  buf.Ingest({MakeOutcome(PeriodAt(1), 3), MakeOutcome(PeriodAt(2), 8)});
  const auto before = buf.Digits();

  CHECK(buf.Ingest({MakeOutcome(PeriodAt(1), 9)}) == 0);
  CHECK(buf.Digits() == before);
  CHECK(buf.Find(PeriodAt(1))->digit == 3);

  // Duplicates inside one batch count once.
  CHECK(buf.Ingest({MakeOutcome(PeriodAt(5), 6), MakeOutcome(PeriodAt(5), 2)}) ==
        1);
  CHECK(buf.newest().digit == 6);
}

TEST_CASE("DataBuffer never exceeds capacity and evicts the oldest",
          "[buffer]") {
  DataBuffer buf(3);
  for (int i = 1; i <= 7; ++i) {
    buf.Ingest({MakeOutcome(PeriodAt(i), i % 10)});
    CHECK(buf.size() <= 3);
  }
  CHECK(buf.size() == 3);
  CHECK(buf.Contains(PeriodAt(7)));
  CHECK(buf.Contains(PeriodAt(5)));
  CHECK_FALSE(buf.Contains(PeriodAt(4)));
  CHECK(buf.Find(PeriodAt(1)) == nullptr);

  // An evicted id is no longer remembered.
  CHECK(buf.Ingest({MakeOutcome(PeriodAt(1), 0)}) == 1);
  CHECK(buf.newest().period_id == PeriodAt(1));
  CHECK_FALSE(buf.Contains(PeriodAt(5)));
}

TEST_CASE("DataBuffer rejects a zero capacity", "[buffer]") {
  CHECK_THROWS_AS(DataBuffer(0), std::invalid_argument);
}

TEST_CASE("Buffer built from newest-first digits reads back the same",
          "[buffer]") {
  const std::vector<int> digits = {9, 0, 4, 4, 7};
  const auto buf = BufferFromDigits(digits);
  CHECK(buf.Digits() == digits);
  CHECK(buf[0].digit == 9);
}

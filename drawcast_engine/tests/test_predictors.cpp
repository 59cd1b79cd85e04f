#include <catch2/catch.hpp>

#include "drawcast/model_tables.hpp"
#include "drawcast/predictors.hpp"
#include "test_helpers.hpp"

using namespace drawcast;
using drawcast::testing::BufferFromDigits;
using drawcast::testing::Repeat;
using drawcast::testing::ScrambledDigits;

namespace {

const std::vector<int> kPatternLengths = {3, 4, 5, 6, 7, 8};
const std::vector<int> kFrequencyWindows = {10, 20, 30};

}  // namespace

TEST_CASE("Tables walk the newest-first digit sequence", "[tables]") {
  // Newest first: 1 2 3 4
  const auto buf = BufferFromDigits({1, 2, 3, 4});

  const auto markov = BuildMarkovTable(buf, 2);
  REQUIRE(markov.count("1") == 1);
  CHECK(markov.at("1").counts[2] == 1);
  REQUIRE(markov.count("1-2") == 1);
  CHECK(markov.at("1-2").counts[3] == 1);
  CHECK(markov.count("3-4") == 0);
  CHECK(markov.size() == 5);

  const auto patterns = BuildPatternTable(buf, {3, 4});
  REQUIRE(patterns.count("123") == 1);
  CHECK(patterns.at("123").counts[4] == 1);
  CHECK(patterns.size() == 1);

  CHECK(PatternKey({5, 2, 1, 3}, 1, 2) == "21");
  CHECK(MarkovKey({5, 2, 1, 3}, 0, 3) == "5-2-1");
}

TEST_CASE("DigitCounts majority and share", "[tables]") {
  DigitCounts c;
  CHECK(c.MajorityShare() == 0.0);
  c.Add(7);
  c.Add(2);
  c.Add(7);
  CHECK(c.total == 3);
  CHECK(c.MajorityDigit() == 7);
  CHECK(c.MajorityShare() == Approx(2.0 / 3.0));

  DigitCounts tie;
  tie.Add(6);
  tie.Add(1);
  CHECK(tie.MajorityDigit() == 1);

  CHECK_THROWS_AS(c.Add(10), std::out_of_range);
}

TEST_CASE("Markov order 3 on 5-5-5 predicts BIG with full confidence",
          "[markov]") {
  const auto buf = BufferFromDigits(Repeat({5}, 12));

  MarkovTable table;
  for (int i = 0; i < 9; ++i) table["5-5-5"].Add(5);

  const auto out = PredictMarkov(buf, table, 3);
  CHECK(out.label == Label::Big);
  CHECK(out.confidence == Approx(1.0));
  CHECK(out.source == "markov_order3");

  // Same answer from a rebuilt table.
  const auto rebuilt = PredictMarkov(buf, BuildMarkovTable(buf, 3), 3);
  CHECK(rebuilt.label == Label::Big);
  CHECK(rebuilt.confidence == Approx(1.0));
}

TEST_CASE("Markov falls back to a lower order, then to anti-persistence",
          "[markov]") {
  const auto buf = BufferFromDigits({8, 1, 1});

  MarkovTable table;
  table["8"].Add(0);
  table["8"].Add(0);
  table["8"].Add(9);
  const auto low = PredictMarkov(buf, table, 3);
  CHECK(low.source == "markov_order1");
  CHECK(low.label == Label::Small);
  CHECK(low.confidence == Approx(2.0 / 3.0));

  const auto fb = PredictMarkov(buf, MarkovTable{}, 3);
  CHECK(fb.source == "markov_fallback");
  CHECK(fb.label == Label::Small);  // newest 8 is BIG
  CHECK(fb.confidence == Approx(0.51));
}

TEST_CASE("Pattern reads a constant history", "[pattern]") {
  const auto buf = BufferFromDigits(Repeat({6}, 20));
  const auto table = BuildPatternTable(buf, kPatternLengths);

  const auto out = PredictPattern(buf, table, kPatternLengths);
  CHECK(out.source == "pattern");
  CHECK(out.label == Label::Big);
  CHECK(out.confidence == Approx(1.0));
}

TEST_CASE("Pattern keeps the first length on a confidence tie", "[pattern]") {
  // Newest first: 1 2 3 4 5 6. Contexts "123" and "1234" both qualify with
  // share 1.0 but disagree on the label.
  const auto buf = BufferFromDigits({1, 2, 3, 4, 5, 6});
  PatternTable table;
  for (int i = 0; i < 3; ++i) {
    table["123"].Add(9);
    table["1234"].Add(0);
  }

  const auto out = PredictPattern(buf, table, kPatternLengths);
  CHECK(out.source == "pattern");
  CHECK(out.label == Label::Big);
  CHECK(out.confidence == Approx(1.0));

  // Trying length 4 first flips the winner.
  const auto reversed = PredictPattern(buf, table, {4, 3});
  CHECK(reversed.label == Label::Small);

  // A strictly higher share still beats the earlier length.
  table["1234"].Add(0);
  table["123"].Add(1);
  const auto higher = PredictPattern(buf, table, kPatternLengths);
  CHECK(higher.label == Label::Small);
  CHECK(higher.confidence == Approx(1.0));
}

TEST_CASE("Pattern fallback uses the newest ten outcomes", "[pattern]") {
  // 6 BIG among the newest 10.
  const auto buf =
      BufferFromDigits({9, 9, 9, 9, 9, 9, 0, 0, 0, 0, 0, 0, 0, 0, 0});
  const auto out = PredictPattern(buf, PatternTable{}, kPatternLengths);
  CHECK(out.source == "pattern_fallback");
  CHECK(out.label == Label::Big);
  CHECK(out.confidence == Approx(0.52));

  const auto small = PredictPattern(BufferFromDigits({1, 2, 3, 4, 9}),
                                    PatternTable{}, kPatternLengths);
  CHECK(small.label == Label::Small);
}

TEST_CASE("Frequency model windows and cap", "[frequency]") {
  const auto short_buf = BufferFromDigits(Repeat({7}, 9));
  const auto none = PredictFrequency(short_buf, kFrequencyWindows);
  CHECK(none.source == "frequency_insufficient");
  CHECK(none.label == Label::Big);
  CHECK(none.confidence == Approx(0.50));

  const auto all_big = PredictFrequency(BufferFromDigits(Repeat({7}, 30)),
                                        kFrequencyWindows);
  CHECK(all_big.source == "frequency");
  CHECK(all_big.label == Label::Big);
  CHECK(all_big.confidence == Approx(kFrequencyCap));

  const auto all_small = PredictFrequency(BufferFromDigits(Repeat({2}, 12)),
                                          kFrequencyWindows);
  CHECK(all_small.label == Label::Small);
  CHECK(all_small.confidence <= kFrequencyCap);
}

TEST_CASE("Trend model reverses a short-term excursion", "[trend]") {
  std::vector<int> digits(10, 8);
  digits.insert(digits.end(), 20, 1);
  const auto buf = BufferFromDigits(digits);

  const auto out = PredictTrend(BuildTrendWindows(buf));
  CHECK(out.label == Label::Small);
  CHECK(out.confidence == Approx(0.75));
}

TEST_CASE("Quantum model follows the frequency when entropy is low",
          "[quantum]") {
  const auto buf = BufferFromDigits(Repeat({9}, 40));

  MarketState ordered;
  ordered.entropy = 0.0;
  const auto out = PredictQuantum(buf, ordered);
  CHECK(out.label == Label::Big);
  CHECK(out.confidence == Approx(kQuantumCap));

  MarketState noisy;
  noisy.entropy = 1.0;
  const auto neutral = PredictQuantum(buf, noisy);
  CHECK(neutral.label == Label::Big);
  CHECK(neutral.confidence == Approx(0.05));
}

TEST_CASE("Model confidences stay within their caps", "[predictors]") {
  for (unsigned seed : {1u, 2u, 3u, 4u, 5u}) {
    const auto buf = BufferFromDigits(ScrambledDigits(120, seed));
    const auto patterns = BuildPatternTable(buf, kPatternLengths);
    const auto markov = BuildMarkovTable(buf, 3);
    MarketState market;
    REQUIRE(AnalyzeMarketState(buf, market, 0));

    const auto p = PredictPattern(buf, patterns, kPatternLengths);
    CHECK(p.confidence >= 0.0);
    CHECK(p.confidence <= 1.0);

    const auto m = PredictMarkov(buf, markov, 3);
    CHECK(m.confidence >= 0.0);
    CHECK(m.confidence <= 1.0);

    const auto f = PredictFrequency(buf, kFrequencyWindows);
    CHECK(f.confidence <= kFrequencyCap);

    const auto t = PredictTrend(BuildTrendWindows(buf));
    CHECK(t.confidence >= kTrendFloor);
    CHECK(t.confidence <= kTrendCap);

    const auto q = PredictQuantum(buf, market);
    CHECK(q.confidence <= kQuantumCap);
  }
}

TEST_CASE("Model names round-trip", "[predictors]") {
  for (ModelId id : kAllModels) {
    const auto back = ModelFromName(ModelName(id));
    REQUIRE(back.has_value());
    CHECK(*back == id);
  }
  CHECK_FALSE(ModelFromName("lstm").has_value());
  CHECK(std::string(ModelName(ModelId::Neural)) == "neural");
}

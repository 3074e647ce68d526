#include <flowcap/limiter/flow_limiter.hpp>
#include <flowcap/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

namespace {

using flowcap::testing::amount;

}  // namespace

TEST(flow_limiter_concurrency, concurrent_outflows_never_exceed_limit) {
  auto clock = flowcap::testing::manual_clock{};
  auto limiter = flowcap::limiter::flow_limiter{
      flowcap::testing::make_options(), clock.source()};
  auto subject = flowcap::testing::make_hash(1);
  limiter.set_limit(subject, amount(1000), flowcap::testing::make_hash(9));

  auto admitted = std::atomic<uint64_t>{0};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (auto i = 0; i < 500; ++i) {
        if (limiter.record_outflow(subject, amount(1)).ok()) {
          admitted.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(admitted.load(), 1000u);
  EXPECT_EQ(limiter.current_outflow(subject), amount(1000));
}

TEST(flow_limiter_concurrency, mixed_directions_keep_net_flow_bounded) {
  auto clock = flowcap::testing::manual_clock{};
  auto limiter = flowcap::limiter::flow_limiter{
      flowcap::testing::make_options(), clock.source()};
  auto subject = flowcap::testing::make_hash(1);
  const auto limit = amount(50);
  limiter.set_limit(subject, limit, flowcap::testing::make_hash(9));

  auto admitted_out = std::atomic<uint64_t>{0};
  auto admitted_in = std::atomic<uint64_t>{0};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (auto i = 0; i < 400; ++i) {
        auto size = static_cast<uint64_t>((i % 7) + 1);
        if ((t % 2) == 0) {
          if (limiter.record_outflow(subject, amount(size)).ok()) {
            admitted_out.fetch_add(size);
          }
        } else if (limiter.record_inflow(subject, amount(size)).ok()) {
          admitted_in.fetch_add(size);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto out = limiter.current_outflow(subject);
  auto in = limiter.current_inflow(subject);
  EXPECT_EQ(out, amount(admitted_out.load()));
  EXPECT_EQ(in, amount(admitted_in.load()));
  EXPECT_LE(out, in + limit);
  EXPECT_LE(in, out + limit);
}

TEST(flow_limiter_concurrency, independent_subjects_progress_in_parallel) {
  auto clock = flowcap::testing::manual_clock{};
  auto limiter = flowcap::limiter::flow_limiter{
      flowcap::testing::make_options(), clock.source()};
  constexpr auto kSubjects = 4;
  for (auto s = 0; s < kSubjects; ++s) {
    limiter.set_limit(flowcap::testing::make_hash(static_cast<uint8_t>(s)),
                      amount(100), flowcap::testing::make_hash(9));
  }

  auto threads = std::vector<std::thread>{};
  for (auto s = 0; s < kSubjects; ++s) {
    threads.emplace_back([&, s] {
      auto subject = flowcap::testing::make_hash(static_cast<uint8_t>(s));
      for (auto i = 0; i < 200; ++i) {
        (void)limiter.record_outflow(subject, amount(1));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (auto s = 0; s < kSubjects; ++s) {
    EXPECT_EQ(limiter.current_outflow(
                  flowcap::testing::make_hash(static_cast<uint8_t>(s))),
              amount(100));
  }
}

TEST(flow_limiter_concurrency, batch_updates_are_seen_whole) {
  auto clock = flowcap::testing::manual_clock{};
  auto limiter = flowcap::limiter::flow_limiter{
      flowcap::testing::make_options(), clock.source()};
  constexpr auto kBatches = 8;
  constexpr auto kBatchSize = 16;

  auto done = std::atomic<bool>{false};
  auto partial = std::atomic<uint64_t>{0};
  auto reader = std::thread{[&] {
    while (!done.load()) {
      if ((limiter.subjects().size() % kBatchSize) != 0) {
        partial.fetch_add(1);
      }
    }
  }};

  for (auto b = 0; b < kBatches; ++b) {
    auto subjects = std::vector<flowcap::schema::subject_id_t>{};
    auto limits = std::vector<flowcap::schema::amount_t>{};
    for (auto i = 0; i < kBatchSize; ++i) {
      subjects.push_back(flowcap::testing::make_hash(
          static_cast<uint8_t>((b * kBatchSize) + i + 1)));
      limits.push_back(amount(10));
    }
    EXPECT_TRUE(
        limiter.set_limits(subjects, limits, flowcap::testing::make_hash(9))
            .ok());
  }
  done.store(true);
  reader.join();

  EXPECT_EQ(partial.load(), 0u);
  EXPECT_EQ(limiter.subjects().size(),
            static_cast<std::size_t>(kBatches * kBatchSize));
}

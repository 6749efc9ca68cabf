#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace urlsh {

// Source of uniform indices; swapped out in tests to force collisions.
class RandomSource {
public:
  virtual ~RandomSource() = default;
  // Returns a value in [0, bound). bound is never zero.
  virtual std::size_t next_index(std::size_t bound) = 0;
};

class Mt19937Source : public RandomSource {
public:
  Mt19937Source();
  explicit Mt19937Source(std::uint64_t seed);
  std::size_t next_index(std::size_t bound) override;

private:
  std::mutex mu_;
  std::mt19937_64 rng_;
};

class ShortCodeGenerator {
public:
  static constexpr std::size_t kDefaultLength = 6;
  static const std::string& alphabet();

  ShortCodeGenerator();
  explicit ShortCodeGenerator(std::shared_ptr<RandomSource> source,
                              std::size_t length = kDefaultLength);

  std::string generate() const;
  std::size_t length() const { return length_; }

private:
  std::shared_ptr<RandomSource> source_;
  std::size_t length_;
};

} // namespace urlsh

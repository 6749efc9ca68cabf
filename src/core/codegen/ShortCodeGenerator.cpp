#include "ShortCodeGenerator.hpp"

#include <stdexcept>
#include <utility>

namespace urlsh {

Mt19937Source::Mt19937Source() : rng_(std::random_device{}()) {}

Mt19937Source::Mt19937Source(std::uint64_t seed) : rng_(seed) {}

std::size_t Mt19937Source::next_index(std::size_t bound) {
  std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
  std::lock_guard<std::mutex> lock(mu_);
  return dist(rng_);
}

const std::string& ShortCodeGenerator::alphabet() {
  static const std::string k =
    "abcdefghijklmnopqrstuvwxyz"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "0123456789";
  return k;
}

ShortCodeGenerator::ShortCodeGenerator()
  : ShortCodeGenerator(std::make_shared<Mt19937Source>()) {}

ShortCodeGenerator::ShortCodeGenerator(std::shared_ptr<RandomSource> source,
                                       std::size_t length)
  : source_(std::move(source)), length_(length) {
  if (!source_) throw std::invalid_argument("random source is null");
  if (length_ == 0) throw std::invalid_argument("short code length must be positive");
}

std::string ShortCodeGenerator::generate() const {
  const auto& chars = alphabet();
  std::string code;
  code.reserve(length_);
  for (std::size_t i = 0; i < length_; ++i) {
    std::size_t idx = source_->next_index(chars.size());
    // A misbehaving source must not index past the alphabet.
    code += chars[idx % chars.size()];
  }
  return code;
}

} // namespace urlsh

#include "planner/chunk_planner.hpp"
#include "errors/errors.hpp"
#include <cmath>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace planner {

namespace {
// Absorbs the representation error of overhead factors such as 1.6
constexpr double PLAN_EPSILON = 1e-9;
}

std::size_t plan_read_size(std::size_t target_size, codec::CodecType codec) {
  if (target_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Planner: Target segment size must be positive";
    throw errors::InvalidArgumentError("target segment size must be positive");
  }

  const auto& traits = codec::traits(codec);
  double units = (static_cast<double>(target_size) / traits.overhead)
               / static_cast<double>(traits.alignment);
  std::size_t read_size = static_cast<std::size_t>(std::floor(units + PLAN_EPSILON)) * traits.alignment;

  if (read_size == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Planner: Target " << target_size << " too small for " << traits.name
                             << ", using one alignment quantum";
    read_size = traits.alignment;
  }

  BOOST_LOG_TRIVIAL(debug) << "Planner: " << traits.name << " target " << target_size
                           << " -> read size " << read_size;
  return read_size;
}

} // namespace planner
} // namespace chunkcache

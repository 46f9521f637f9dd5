#ifndef __G2048_RANDOMUTILS_H_
#define __G2048_RANDOMUTILS_H_

#include <random>
#include <type_traits>

namespace Rand {

template<typename Int_T>
class Util
{
 public:
  using Engine = typename std::
      conditional<sizeof(Int_T) <= 4, std::mt19937, std::mt19937_64>::type;

  Util() = default;
  Util(typename Engine::result_type seed) : gen(seed) {}

  /**
   * Returns a number from _min to _max (including  _max!)
   */
  Int_T get(Int_T _min, Int_T _max)
  {
    return std::uniform_int_distribution<Int_T>(_min, _max)(gen);
  }

  /**
   * Returns true with probability `p`.
   */
  bool chance(double p)
  {
    return std::bernoulli_distribution(p)(gen);
  }

  void seed(typename Engine::result_type s) { gen.seed(s); }

 private:
  Engine gen{std::random_device{}()};
};

} // namespace Rand

#endif

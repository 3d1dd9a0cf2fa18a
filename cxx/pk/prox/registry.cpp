#include "registry.hpp"

#include "lsq.hpp"
#include "norms.hpp"
#include "project.hpp"
#include "smooth.hpp"

#include <algorithm>

namespace pk::Proxs {

namespace {
template <typename T> auto Need(std::optional<T> const &o, std::string const &op, char const *arg) -> T const &
{
  if (!o) { throw Log::ConfigFailure("Proxs", "Operator {} requires argument {}", op, arg); }
  return *o;
}
} // namespace

auto Opts::given() const -> std::vector<std::string>
{
  std::vector<std::string> g;
  if (penalty) { g.push_back("penalty"); }
  if (axis) { g.push_back("axis"); }
  if (A) { g.push_back("A"); }
  if (b) { g.push_back("b"); }
  if (reference) { g.push_back("reference"); }
  if (f_df) { g.push_back("f_df"); }
  if (numIter) { g.push_back("numIter"); }
  if (denoiser) { g.push_back("denoiser"); }
  return g;
}

auto Registry() -> std::map<std::string, Entry> const &
{
  static std::map<std::string, Entry> const registry{
    {"nucnorm", {{"penalty"}, [](Opts const &o) { return NuclearNorm::Make(Need(o.penalty, "nucnorm", "penalty")); }}},
    {"sparse", {{"penalty"}, [](Opts const &o) { return L1::Make(Need(o.penalty, "sparse", "penalty")); }}},
    {"nonneg", {{}, [](Opts const &) { return NonNegative::Make(); }}},
    {"linsys",
     {{"A", "b"}, [](Opts const &o) { return LinearSystem::Make(Need(o.A, "linsys", "A"), Need(o.b, "linsys", "b")); }}},
    {"squared_error",
     {{"reference"}, [](Opts const &o) { return SquaredError::Make(Need(o.reference, "squared_error", "reference")); }}},
    {"lbfgs",
     {{"f_df", "numIter"},
      [](Opts const &o) {
        if (!o.f_df) { throw Log::ConfigFailure("Proxs", "Operator lbfgs requires argument f_df"); }
        return SmoothObjective::Make(o.f_df, o.numIter.value_or(20));
      }}},
    {"tvd",
     {{"penalty", "denoiser"},
      [](Opts const &o) { return TV::Make(Need(o.penalty, "tvd", "penalty"), o.denoiser ? o.denoiser : TV::DefaultDenoiser()); }}},
    {"smooth",
     {{"axis", "penalty"},
      [](Opts const &o) { return Laplacian::Make(Need(o.axis, "smooth", "axis"), Need(o.penalty, "smooth", "penalty")); }}},
    {"semidefinite_cone", {{}, [](Opts const &) { return SemidefiniteCone::Make(); }}}};
  return registry;
}

auto Names() -> std::vector<std::string>
{
  std::vector<std::string> names;
  for (auto const &kv : Registry()) {
    names.push_back(kv.first);
  }
  return names;
}

auto Make(std::string const &name, Opts const &opts) -> Prox::Ptr
{
  auto const &reg = Registry();
  auto const  it = reg.find(name);
  if (it == reg.end()) { throw Log::ConfigFailure("Proxs", "{} is not a valid operator, choose from {}", name, Names()); }
  auto const &entry = it->second;
  for (auto const &g : opts.given()) {
    if (std::find(entry.args.cbegin(), entry.args.cend(), g) == entry.args.cend()) {
      throw Log::ConfigFailure("Proxs", "Operator {} does not take argument {}, valid arguments are {}", name, g, entry.args);
    }
  }
  Log::Debug("Proxs", "Making {}", name);
  return entry.make(opts);
}

} // namespace pk::Proxs

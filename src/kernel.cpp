#include <stdexcept>
#include <mcmclab/kernel/hmc.hpp>
#include <mcmclab/kernel/kernel.hpp>
#include <mcmclab/kernel/metropolis.hpp>
#include <mcmclab/kernel/slice.hpp>
#include <mcmclab/log/logger.hpp>

namespace mcmclab::kernel {

KernelFunction kernel_function(KernelKind kind) {
  switch (kind) {
  case KernelKind::rwm:
    return &step_rwm;
  case KernelKind::mh:
    return &step_mh;
  case KernelKind::slice:
    return &step_slice;
  case KernelKind::elliptical:
    return &step_elliptical;
  case KernelKind::hitnrun:
    return &step_hit_and_run;
  case KernelKind::hmc:
    return &step_hmc;
  }
  throw std::invalid_argument("unhandled kernel kind");
}

bool requires_gradient(KernelKind kind) {
  return kind == KernelKind::hmc;
}

KernelKind parse_kernel(std::string_view name) {
  if (name == "rwm")
    return KernelKind::rwm;
  if (name == "mh")
    return KernelKind::mh;
  if (name == "slice")
    return KernelKind::slice;
  if (name == "elliptical")
    return KernelKind::elliptical;
  if (name == "hitnrun")
    return KernelKind::hitnrun;
  if (name == "hmc")
    return KernelKind::hmc;

  MLOG_ERROR("Unknown kernel '{}'", name);
  throw std::invalid_argument("unknown kernel: " + std::string(name));
}

std::string_view to_string(KernelKind kind) {
  switch (kind) {
  case KernelKind::rwm:
    return "rwm";
  case KernelKind::mh:
    return "mh";
  case KernelKind::slice:
    return "slice";
  case KernelKind::elliptical:
    return "elliptical";
  case KernelKind::hitnrun:
    return "hitnrun";
  case KernelKind::hmc:
    return "hmc";
  }
  return "unknown";
}

const std::vector<std::string> &kernel_names() {
  static const std::vector<std::string> names{"rwm", "mh", "slice", "elliptical", "hitnrun", "hmc"};
  return names;
}

} // namespace mcmclab::kernel

#include "model/Pressure.hpp"

namespace psistat::model {

const char* resource_name(Resource r) {
  switch (r) {
    case Resource::Cpu: return "cpu";
    case Resource::Io: return "io";
    case Resource::Memory: return "memory";
  }
  return "?";
}

const char* kind_name(StallKind k) {
  return k == StallKind::Full ? "full" : "some";
}

std::string series_name(Resource r, StallKind k) {
  return std::string(resource_name(r)) + "." + kind_name(k);
}

} // namespace psistat::model

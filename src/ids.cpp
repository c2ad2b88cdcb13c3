#include "parkinglot/ids.h"

#include <uuid/uuid.h>

namespace parkinglot {

std::string newUUID() {
  uuid_t u; uuid_generate_random(u);
  char buf[37]; uuid_unparse_lower(u, buf);
  return std::string{buf};
}

}  // namespace parkinglot

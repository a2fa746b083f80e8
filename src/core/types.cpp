#include "cmdai/types.hpp"

namespace cmdai {

std::string role_to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

}  // namespace cmdai

#include "toolexec/store/code_store.hpp"

#include "toolexec/observability/global.hpp"

#include <cctype>

namespace toolexec::store {

common::Result<std::optional<CodeRecord>> lookup_code(ICodeStore &store, const std::string &id) {
  auto result = store.fetch(id);
  if (!result.ok()) {
    observability::record_code_lookup(id, std::string(store.name()), false, result.error());
    return result;
  }
  observability::record_code_lookup(id, std::string(store.name()), result.value().has_value());
  return result;
}

bool is_plain_identifier(const std::string &id) {
  if (id.empty() || id.size() > 128 || id.front() == '.' || id.front() == '-') {
    return false;
  }
  for (const char ch : id) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '_' ||
          ch == '.')) {
      return false;
    }
  }
  return id.find("..") == std::string::npos;
}

} // namespace toolexec::store

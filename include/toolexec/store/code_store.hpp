#pragma once

#include "toolexec/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace toolexec::store {

constexpr std::string_view kNotFoundMessage = "Function not found or has no code";

struct CodeRecord {
  std::string id;
  std::string source_text;
};

/// Read-only access to script records.
class ICodeStore {
public:
  virtual ~ICodeStore() = default;

  /// nullopt when no record with a non-empty body exists; failure when the store itself
  /// could not be read.
  [[nodiscard]] virtual common::Result<std::optional<CodeRecord>> fetch(const std::string &id) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// fetch() plus a CodeLookupEvent on the global observer.
[[nodiscard]] common::Result<std::optional<CodeRecord>> lookup_code(ICodeStore &store,
                                                                    const std::string &id);

/// True for identifiers that can safely become a file name or a URL component.
[[nodiscard]] bool is_plain_identifier(const std::string &id);

} // namespace toolexec::store

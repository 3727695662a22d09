#pragma once

#include "toolexec/config/schema.hpp"
#include "toolexec/net/http_client.hpp"
#include "toolexec/store/code_store.hpp"

#include <memory>

namespace toolexec::store {

[[nodiscard]] common::Result<std::unique_ptr<ICodeStore>>
create_code_store(const config::Config &config, std::shared_ptr<net::HttpClient> http_client);

} // namespace toolexec::store

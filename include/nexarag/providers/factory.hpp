#pragma once

#include "nexarag/providers/http.hpp"
#include "nexarag/providers/traits.hpp"

#include <memory>

namespace nexarag::providers {

[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const config::ProviderConfig &config, std::uint64_t config_version,
                std::shared_ptr<HttpClient> http_client);

} // namespace nexarag::providers

#pragma once

#include "normalizer.hpp"
#include <string>
#include <vector>

class ResponseBuilder {
public:
    // JSON array of items in accumulation order, encoded under `encoding`.
    // Throws RelayError (500) when serialization or encoding fails.
    static std::string build(const std::vector<NormalizedItem>& items, const std::string& encoding);
};

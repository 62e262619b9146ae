#pragma once

#include "persistence/transfer_state.h"
#include <optional>
#include <string>
#include <vector>

namespace persistence {

// Durable key-value storage for TransferState records. Implementations
// serialise their own access; put/remove return false on failure.
class StateStore {
  public:
    virtual ~StateStore() = default;

    virtual const char* name() const = 0;
    virtual bool put(const std::string& key, const TransferState& state) = 0;
    virtual std::optional<TransferState> get(const std::string& key) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual std::vector<TransferState> load_all() = 0;
};

} // namespace persistence

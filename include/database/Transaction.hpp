#pragma once

#include "database/Result.hpp"

#include <cstdint>
#include <string>

namespace mds::database {

class DBConnection;

// One SQLite transaction on a pooled connection. Rolls back on destruction
// unless commit() was called.
class Transaction {
  public:
    Transaction(DBConnection& conn, bool write);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result exec(const std::string& prepped, const Params& params = Params{});

    [[nodiscard]] int64_t lastInsertId() const;

    void commit();

  private:
    DBConnection& conn_;
    bool committed_ = false;
};

}

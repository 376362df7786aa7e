#pragma once

#include <memory>
#include <string>
#include "cardstore/Config.hpp"
#include "cardstore/Store.hpp"
#include "cardstore/TableClient.hpp"

namespace cardstore {

// Document kept as one row of a key -> payload table; history rows are
// appended to a parallel table.
class RemoteStore : public Store {
public:
    RemoteStore(std::unique_ptr<TableClient> client, const Config& cfg);

    Document read() override;
    bool write(const Document& doc) override;
    bool appendHistory(const Document& doc) override;
    std::string describe() const override;

private:
    std::unique_ptr<TableClient> client_;
    std::string table_;
    std::string historyTable_;
    std::string key_;
};

} // namespace cardstore

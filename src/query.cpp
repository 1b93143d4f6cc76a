#include "mailjmap/query.hpp"
#include "mailjmap/sync_exception.hpp"

Query::Query() noexcept : _clauses(), _order() {
}

Query Query::InAccount(std::string accountId) {
    Query query;
    query.equal("accountId", accountId);
    return query;
}

void Query::set(std::string col, nlohmann::json rhs) {
    for (auto & clause : _clauses) {
        if (clause.column == col) {
            clause.rhs = rhs;
            return;
        }
    }
    _clauses.push_back(Clause{col, rhs});
}

Query & Query::equal(std::string col, std::string val) {
    set(col, val);
    return *this;
}

Query & Query::equal(std::string col, double val) {
    set(col, val);
    return *this;
}

Query & Query::live() {
    return equal("isDeleted", 0);
}

Query & Query::orderBy(std::string col, bool ascending) {
    _order.push_back({col, ascending});
    return *this;
}

std::string Query::getSQL() {
    std::string result = "";

    for (size_t ii = 0; ii < _clauses.size(); ii ++) {
        result += (ii == 0) ? " WHERE " : " AND ";
        result += _clauses[ii].column + " = ?";
    }

    for (size_t ii = 0; ii < _order.size(); ii ++) {
        result += (ii == 0) ? " ORDER BY " : ", ";
        result += _order[ii].first + (_order[ii].second ? " ASC" : " DESC");
    }
    return result;
}

void Query::bind(SQLite::Statement & query) {
    int ii = 1;
    for (const auto & clause : _clauses) {
        if (clause.rhs.is_number_integer()) {
            query.bind(ii++, clause.rhs.get<long long>());
        } else if (clause.rhs.is_number()) {
            query.bind(ii++, clause.rhs.get<double>());
        } else if (clause.rhs.is_string()) {
            query.bind(ii++, clause.rhs.get<std::string>());
        } else {
            throw SyncException("query-builder", "Unable to bind value for column " + clause.column, false);
        }
    }
}

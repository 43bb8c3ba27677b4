#pragma once

#include <libpq-fe.h>
#include <memory>

namespace askql {

// RAII wrappers for libpq resources

struct PGConnDeleter {
    void operator()(PGconn* conn) const noexcept {
        if (conn) {
            PQfinish(conn);
        }
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

struct PGCancelDeleter {
    void operator()(PGcancel* cancel) const noexcept {
        if (cancel) {
            PQfreeCancel(cancel);
        }
    }
};
using PGCancelPtr = std::unique_ptr<PGcancel, PGCancelDeleter>;

} // namespace askql

#pragma once

#include <string>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace storykb::db {

/*
  Runs `fn(tx)` inside a fresh transaction and commits it, retrying the
  whole unit when Commit() loses to a concurrent writer.

  Exhausted retries surface as TransientStoreError; every other exception
  propagates after the transaction's destructor rolled it back.
*/
template <typename Fn>
auto RunInTransaction(Repository& repo, const std::string& what, Fn&& fn, int max_attempts = 8) {
  for (int attempt = 1;; ++attempt) {
    auto tx = repo.Begin();
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Transaction&>>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const ConflictError& e) {
      if (attempt >= max_attempts) {
        throw util::TransientStoreError(what + ": " + e.what() + " attempts=" + std::to_string(attempt));
      }
    }
  }
}

} // namespace storykb::db

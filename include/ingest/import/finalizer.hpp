#pragma once

#include "ingest/core/abort_token.hpp"
#include "ingest/import/catalog.hpp"
#include "ingest/import/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ingest::import {

/**
 * @brief Hands valid files to the catalog writer (step 5)
 *
 * Invalid files are skipped; a writer error is counted and the batch
 * continues.
 */
class Finalizer {
public:
    explicit Finalizer(CatalogWriter& writer) : writer_(writer) {}

    FinalizationResult finalize(const std::vector<ValidatedFile>& files,
                                const AbortToken& abort = {},
                                const std::function<void(std::size_t done, std::size_t total)>& on_progress = {});

private:
    CatalogWriter& writer_;
};

} // namespace ingest::import

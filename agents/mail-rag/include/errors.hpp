#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

struct MailRagError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Mail source unreachable; aborts the run and keeps the previous checkpoint.
struct FetchFailure : MailRagError {
    using MailRagError::MailRagError;
};

// Summarize/embed failed for one document.
struct TransformFailure : MailRagError {
    using MailRagError::MailRagError;
};

struct StoreFailure : MailRagError {
    using MailRagError::MailRagError;
};

struct SearchFailure : MailRagError {
    using MailRagError::MailRagError;
};

struct DimensionMismatch : MailRagError {
    DimensionMismatch(std::size_t expected_dim, std::size_t actual_dim)
        : MailRagError("dimension mismatch: expected " + std::to_string(expected_dim) +
                       ", got " + std::to_string(actual_dim)),
          expected(expected_dim), actual(actual_dim) {}

    std::size_t expected;
    std::size_t actual;
};

struct IngestionBusy : MailRagError {
    IngestionBusy() : MailRagError("an ingestion run is already in progress") {}
};

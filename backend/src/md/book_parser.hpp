#pragma once
#include "book_events.hpp"
#include <string>
#include <vector>

// Uniform interface for any exchange book parser (REST snapshot + stream updates).
// Irrelevant frames return false; a relevant but malformed payload throws FeedError.
struct IBookParser {
    virtual ~IBookParser() = default;

    // Parse a raw JSON stream frame into one or more BookEvent(s).
    virtual bool parse(const std::string& raw, std::vector<BookEvent>& out) = 0;

    // Parse a REST depth body into a full snapshot.
    virtual BookSnapshot parse_snapshot(const std::string& raw) = 0;
};

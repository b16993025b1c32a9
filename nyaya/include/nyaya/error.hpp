#pragma once
// Error taxonomy for the graph and logic layers
//
// Both layers throw. A caller that only cares about one layer can catch
// GraphError or LogicError; LogicError::wrap carries graph failures upward
// without losing their kind.

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace nyaya {

enum class GraphErrorKind : uint8_t {
    NotFound = 0,
    Duplicate = 1,
    InvalidTriple = 2,
    Storage = 3,
    Serialization = 4,
    Query = 5,
    Index = 6,
    Io = 7,
    Config = 8,
    BackendUnavailable = 9,
};

inline const char* to_string(GraphErrorKind kind) {
    switch (kind) {
        case GraphErrorKind::NotFound: return "not found";
        case GraphErrorKind::Duplicate: return "duplicate";
        case GraphErrorKind::InvalidTriple: return "invalid triple";
        case GraphErrorKind::Storage: return "storage error";
        case GraphErrorKind::Serialization: return "serialization error";
        case GraphErrorKind::Query: return "query error";
        case GraphErrorKind::Index: return "index error";
        case GraphErrorKind::Io: return "io error";
        case GraphErrorKind::Config: return "config error";
        case GraphErrorKind::BackendUnavailable: return "backend unavailable";
    }
    return "unknown";
}

class GraphError : public std::runtime_error {
public:
    GraphError(GraphErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message),
          kind_(kind), message_(message) {}

    GraphErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    static GraphError storage(const std::string& msg) {
        return GraphError(GraphErrorKind::Storage, msg);
    }
    static GraphError serialization(const std::string& msg) {
        return GraphError(GraphErrorKind::Serialization, msg);
    }
    static GraphError unavailable(const std::string& msg) {
        return GraphError(GraphErrorKind::BackendUnavailable, msg);
    }

private:
    GraphErrorKind kind_;
    std::string message_;
};

enum class LogicErrorKind : uint8_t {
    InvalidRule = 0,
    RuleConflict = 1,
    ValidationFailed = 2,
    Contradiction = 3,
    InvalidProof = 4,
    UnificationFailed = 5,
    InferenceLoop = 6,
    MaxDepthExceeded = 7,
    MissingPrecondition = 8,
    GraphError = 9,
    SerializationError = 10,
};

inline const char* to_string(LogicErrorKind kind) {
    switch (kind) {
        case LogicErrorKind::InvalidRule: return "invalid rule";
        case LogicErrorKind::RuleConflict: return "rule conflict";
        case LogicErrorKind::ValidationFailed: return "validation failed";
        case LogicErrorKind::Contradiction: return "contradiction";
        case LogicErrorKind::InvalidProof: return "invalid proof";
        case LogicErrorKind::UnificationFailed: return "unification failed";
        case LogicErrorKind::InferenceLoop: return "inference loop";
        case LogicErrorKind::MaxDepthExceeded: return "max depth exceeded";
        case LogicErrorKind::MissingPrecondition: return "missing precondition";
        case LogicErrorKind::GraphError: return "graph error";
        case LogicErrorKind::SerializationError: return "serialization error";
    }
    return "unknown";
}

class LogicError : public std::runtime_error {
public:
    LogicError(LogicErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message),
          kind_(kind), message_(message) {}

    LogicErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    // Only meaningful when kind() == LogicErrorKind::GraphError
    GraphErrorKind graph_kind() const { return graph_kind_; }

    static LogicError wrap(const nyaya::GraphError& e) {
        LogicError err(LogicErrorKind::GraphError, e.what());
        err.graph_kind_ = e.kind();
        return err;
    }

    static LogicError max_depth(size_t depth) {
        LogicError err(LogicErrorKind::MaxDepthExceeded,
                       "depth " + std::to_string(depth) + " reached");
        err.depth_ = depth;
        return err;
    }

    size_t depth() const { return depth_; }

private:
    LogicErrorKind kind_;
    std::string message_;
    GraphErrorKind graph_kind_ = GraphErrorKind::Storage;
    size_t depth_ = 0;
};

} // namespace nyaya

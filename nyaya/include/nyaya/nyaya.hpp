#pragma once
// Nyaya: content-addressed triple store with rule-based inference and proofs
//
// Graph layer:  types, codec, storage backends, GraphStore, N-Triples
// Logic layer:  rules, unification, inference, validation, proofs
// Glue:         JSON codecs, configuration

#include "version.hpp"
#include "log.hpp"
#include "error.hpp"
#include "types.hpp"
#include "codec.hpp"
#include "storage.hpp"
#include "sqlite_backend.hpp"
#include "log_backend.hpp"
#include "graph_store.hpp"
#include "ntriples.hpp"
#include "rule.hpp"
#include "unify.hpp"
#include "proof.hpp"
#include "inference.hpp"
#include "validator.hpp"
#include "builtin.hpp"
#include "json.hpp"
#include "config.hpp"

// nyaya-cli: Command-line interface for the nyaya triple store
//
// Usage: nyaya_cli <command> [options]
//
// Commands:
//   stats      Show store statistics
//   insert     Add a triple
//   find       Pattern query
//   validate   Check a candidate triple against rules
//   infer      Forward-chain rules to a fixpoint
//   prove      Backward-chain a goal and print its proof
//   verify     Check a saved proof against the store

#include <nyaya/nyaya.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <fstream>

using namespace nyaya;

static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "nyaya " << NYAYA_VERSION << " - triple store and logic engine\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Graph Commands:\n"
              << "  stats              Show triple, subject, predicate and object counts\n"
              << "  insert             Add --subj --pred --obj\n"
              << "  remove <id>        Remove the triple with this id (64 hex chars)\n"
              << "  find               Triples matching --subj --pred --obj (any may be omitted)\n"
              << "  import <file.nt>   Load N-Triples\n"
              << "  export             Write the store as N-Triples to stdout\n"
              << "  compact            Rewrite the log backend without dead entries\n\n"
              << "Logic Commands:\n"
              << "  validate           Validate --subj --pred --obj without inserting it\n"
              << "  check              Report contradictions already in the store\n"
              << "  infer              Run forward chaining and insert what it derives\n"
              << "  prove              Prove the goal --subj --pred --obj\n"
              << "  verify <proof>     Check a proof written by 'prove --json'\n\n"
              << "Options:\n"
              << "  --path PATH        Store path (default: ~/.nyaya/store)\n"
              << "  --backend KIND     memory | sqlite | log (default: sqlite)\n"
              << "  --config FILE      JSON configuration file\n"
              << "  --rules FILE       JSON rule set\n"
              << "  --builtin          Add the built-in integrity and semantic rules\n"
              << "  --functional PRED  Treat PRED as single-valued (repeatable)\n"
              << "  --max-iterations N Forward chaining budget\n"
              << "  --max-depth N      Backward chaining depth bound\n"
              << "  --limit N          Page size for find\n"
              << "  --offset N         Skip N results for find\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n"
              << "  -h, --help         Show this help\n\n"
              << "Objects: <name> or _:b<hex> is a node, \"text\" a string;\n"
              << "integers, decimals, true and false are typed; other words are strings.\n\n"
              << "Exit status: 0 on success, 1 on error, 2 when validate rejects the triple,\n"
              << "check finds contradictions or verify rejects the proof.\n";
}

// Object text as typed on the command line
Value parse_object(const std::string& text) {
    if (text.rfind("_:", 0) == 0 || (text.size() >= 2 && text.front() == '<' && text.back() == '>')) {
        auto n = NodeId::parse(text);
        if (!n) throw GraphError(GraphErrorKind::InvalidTriple, "bad node '" + text + "'");
        return Value::node(std::move(*n));
    }
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return Value::string(text.substr(1, text.size() - 2));
    }
    if (text == "true") return Value::boolean(true);
    if (text == "false") return Value::boolean(false);

    if (!text.empty()) {
        const char* begin = text.c_str();
        char* end = nullptr;
        errno = 0;
        long long n = std::strtoll(begin, &end, 10);
        if (*end == '\0' && errno == 0) return Value::integer(n);

        errno = 0;
        double d = std::strtod(begin, &end);
        if (*end == '\0' && errno == 0 && text.find_first_of(".eE") != std::string::npos) {
            return Value::floating(d);
        }
    }
    return Value::string(text);
}

static bool parse_count(const char* text, size_t& out) {
    if (*text == '\0' || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long n = std::strtoull(text, &end, 10);
    if (*end != '\0' || errno != 0) return false;
    out = static_cast<size_t>(n);
    return true;
}

NodeId parse_subject(const std::string& text) {
    auto n = NodeId::parse(text);
    if (!n) throw GraphError(GraphErrorKind::InvalidTriple, "bad subject '" + text + "'");
    return *n;
}

struct PatternArgs {
    std::string subj, pred, obj;

    TriplePattern pattern() const {
        TriplePattern p;
        if (!subj.empty()) p.subject = parse_subject(subj);
        if (!pred.empty()) p.predicate = Predicate(pred);
        if (!obj.empty()) p.object = parse_object(obj);
        return p;
    }

    bool complete() const { return !subj.empty() && !pred.empty() && !obj.empty(); }

    Triple triple() const {
        return Triple(parse_subject(subj), Predicate(pred), parse_object(obj));
    }
};

void print_triple(const Triple& t) {
    std::cout << triple_id(t).short_hex() << "  " << t.to_string() << "\n";
}

int cmd_stats(GraphStore& store, bool json_output) {
    auto s = store.stats();
    if (json_output) {
        auto j = stats_to_json(s);
        j["version"] = NYAYA_VERSION;
        j["backend"] = store.backend().name();
        std::cout << j.dump() << "\n";
        return 0;
    }
    std::cout << "Store Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "  Backend:     " << store.backend().name() << "\n";
    std::cout << "  Triples:     " << s.triple_count << "\n";
    std::cout << "  Subjects:    " << s.subject_count << "\n";
    std::cout << "  Predicates:  " << s.predicate_count << "\n";
    std::cout << "  Objects:     " << s.object_count << "\n";
    std::cout << "  Storage:     " << s.storage_bytes << " bytes\n";
    return 0;
}

int cmd_insert(GraphStore& store, const PatternArgs& args, bool json_output) {
    if (!args.complete()) {
        std::cerr << "[insert] --subj, --pred and --obj are required\n";
        return 1;
    }
    Triple t = args.triple();
    auto [id, inserted] = store.insert_checked(t);
    store.flush();
    if (json_output) {
        std::cout << json{{"id", id.to_hex()}, {"inserted", inserted}}.dump() << "\n";
    } else {
        std::cout << id.to_hex() << (inserted ? "" : "  (already present)") << "\n";
    }
    return 0;
}

int cmd_remove(GraphStore& store, const std::string& hex) {
    auto id = TripleId::from_hex(hex);
    if (!id) {
        std::cerr << "[remove] not a triple id: " << hex << "\n";
        return 1;
    }
    if (!store.remove(*id)) {
        std::cerr << "[remove] no triple " << id->short_hex() << "\n";
        return 1;
    }
    store.flush();
    std::cout << "removed " << id->short_hex() << "\n";
    return 0;
}

int cmd_find(GraphStore& store, const PatternArgs& args, size_t limit, size_t offset, bool json_output) {
    auto result = store.query(args.pattern()).limit(limit).offset(offset).execute();
    if (json_output) {
        json triples = json::array();
        for (const auto& t : result.triples) {
            auto j = triple_to_json(t);
            j["id"] = triple_id(t).to_hex();
            triples.push_back(std::move(j));
        }
        std::cout << json{{"triples", std::move(triples)},
                          {"total", result.total_count},
                          {"has_more", result.has_more}}.dump() << "\n";
        return 0;
    }
    for (const auto& t : result.triples) print_triple(t);
    std::cout << result.triples.size() << " of " << result.total_count << " triples"
              << (result.has_more ? " (more)" : "") << "\n";
    return 0;
}

int cmd_validate(const Validator& validator, const RuleSet& rules, const PatternArgs& args,
                 bool json_output) {
    if (!args.complete()) {
        std::cerr << "[validate] --subj, --pred and --obj are required\n";
        return 1;
    }
    auto result = validator.validate(args.triple(), rules);
    if (json_output) {
        std::cout << validation_to_json(result).dump() << "\n";
    } else {
        std::cout << (result.valid ? "valid" : "invalid") << "\n";
        for (const auto& e : result.errors) std::cout << "  " << e.to_string() << "\n";
    }
    return result.valid ? 0 : 2;
}

int cmd_check(const Validator& validator, bool json_output) {
    auto found = validator.check_contradictions();
    if (json_output) {
        json out = json::array();
        for (const auto& c : found) out.push_back(contradiction_to_json(c));
        std::cout << out.dump() << "\n";
    } else {
        for (const auto& c : found) {
            std::cout << c.description << "\n"
                      << "  " << c.a.to_string() << "\n"
                      << "  " << c.b.to_string() << "\n";
        }
        std::cout << found.size() << " contradictions\n";
    }
    return found.empty() ? 0 : 2;
}

int cmd_infer(GraphStore& store, const RuleSet& rules, const EngineConfig& config, bool json_output) {
    InferenceEngine engine(store, config);
    auto derived = engine.infer_forward(rules);
    store.flush();
    if (json_output) {
        json out = json::array();
        for (const auto& t : derived) out.push_back(triple_to_json(t));
        std::cout << json{{"derived", std::move(out)},
                          {"iterations", engine.stats().iterations}}.dump() << "\n";
        return 0;
    }
    for (const auto& t : derived) print_triple(t);
    std::cout << derived.size() << " triples derived in " << engine.stats().iterations
              << " iterations\n";
    return 0;
}

int cmd_prove(GraphStore& store, const RuleSet& rules, const EngineConfig& config,
              const PatternArgs& args, bool json_output) {
    InferenceEngine engine(store, config);
    auto proof = engine.prove(args.pattern(), rules);
    if (json_output) {
        std::cout << proof_to_json(proof).dump(2) << "\n";
    } else {
        std::cout << proof.to_string();
    }
    return 0;
}

int cmd_verify(const GraphStore& store, const RuleSet& rules, const std::string& file) {
    auto proof = proof_from_json(read_json_file(file));
    std::string why;
    if (!ProofVerifier(rules).check(proof, store, &why)) {
        std::cout << "invalid: " << why << "\n";
        return 2;
    }
    std::cout << "valid: " << proof.conclusion.to_string()
              << (proof.is_fact() ? " (stored fact)" : "") << "\n";
    return 0;
}

int cmd_import(GraphStore& store, const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        std::cerr << "[import] cannot open " << file << "\n";
        return 1;
    }
    size_t added = import_ntriples(store, in);
    store.flush();
    std::cout << "imported " << added << " new triples\n";
    return 0;
}

int cmd_compact(GraphStore& store) {
    auto* log = dynamic_cast<LogBackend*>(&store.backend());
    if (!log) {
        std::cout << store.backend().name() << " backend has nothing to compact\n";
        return 0;
    }
    size_t reclaimed = log->compact();
    std::cout << "reclaimed " << reclaimed << " bytes\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string argument;                  // remove <id>, verify <proof>, import <file>
    std::string config_path;
    std::string rules_path;
    std::optional<std::string> store_path;
    std::optional<std::string> backend;
    std::optional<size_t> max_iterations;
    std::optional<size_t> max_depth;
    std::vector<std::string> functional;
    PatternArgs pattern;
    size_t limit = 0;
    size_t offset = 0;
    bool builtin = false;
    bool json_output = false;
    bool verbose_mode = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            store_path = argv[++i];
        } else if (strcmp(argv[i], "--backend") == 0 && i + 1 < argc) {
            backend = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--rules") == 0 && i + 1 < argc) {
            rules_path = argv[++i];
        } else if (strcmp(argv[i], "--builtin") == 0) {
            builtin = true;
        } else if (strcmp(argv[i], "--functional") == 0 && i + 1 < argc) {
            functional.push_back(argv[++i]);
        } else if ((strcmp(argv[i], "--max-iterations") == 0 || strcmp(argv[i], "--max-depth") == 0 ||
                    strcmp(argv[i], "--limit") == 0 || strcmp(argv[i], "--offset") == 0) && i + 1 < argc) {
            const char* option = argv[i];
            size_t n = 0;
            if (!parse_count(argv[++i], n)) {
                std::cerr << option << " expects a non-negative integer, got '" << argv[i] << "'\n";
                return 1;
            }
            if (strcmp(option, "--max-iterations") == 0) max_iterations = n;
            else if (strcmp(option, "--max-depth") == 0) max_depth = n;
            else if (strcmp(option, "--limit") == 0) limit = n;
            else offset = n;
        // Pattern args
        } else if (strcmp(argv[i], "--subj") == 0 && i + 1 < argc) {
            pattern.subj = argv[++i];
        } else if (strcmp(argv[i], "--pred") == 0 && i + 1 < argc) {
            pattern.pred = argv[++i];
        } else if (strcmp(argv[i], "--obj") == 0 && i + 1 < argc) {
            pattern.obj = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "nyaya " << NYAYA_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if (argument.empty()) {
                argument = argv[i];
            } else {
                std::cerr << "Unexpected argument: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }
    if ((command == "remove" || command == "verify" || command == "import") && argument.empty()) {
        std::cerr << "[" << command << "] missing argument\n";
        return 1;
    }

    try {
        Config config = config_path.empty() ? Config::defaults() : load_config(config_path);
        if (store_path) config.storage.path = *store_path;
        if (backend) {
            auto kind = parse_backend_kind(*backend);
            if (!kind) {
                std::cerr << "Unknown backend: " << *backend << "\n";
                return 1;
            }
            config.storage.kind = *kind;
        }
        if (max_iterations) config.engine.max_iterations = *max_iterations;
        if (max_depth) config.engine.max_depth = *max_depth;
        for (const auto& p : functional) config.validator.functional_predicates.insert(p);
        set_verbose(verbose_mode || config.verbose);

        RuleSetBuilder rule_builder("cli");
        if (!rules_path.empty()) rule_builder.add_all(load_rules(rules_path));
        if (builtin) {
            rule_builder.add_all(integrity_rules());
            rule_builder.add_all(semantic_rules());
        }
        RuleSet rules = rule_builder.build();

        GraphStore store(open_backend(config.storage));
        Validator validator(store, config.validator);
        log_debug("cli", "%s store at %s, %zu triples, %zu rules",
                  to_string(config.storage.kind), config.storage.path.c_str(),
                  store.count(), rules.size());

        int rc = 1;
        if (command == "stats") {
            rc = cmd_stats(store, json_output);
        } else if (command == "insert") {
            rc = cmd_insert(store, pattern, json_output);
        } else if (command == "remove") {
            rc = cmd_remove(store, argument);
        } else if (command == "find") {
            rc = cmd_find(store, pattern, limit, offset, json_output);
        } else if (command == "validate") {
            rc = cmd_validate(validator, rules, pattern, json_output);
        } else if (command == "check") {
            rc = cmd_check(validator, json_output);
        } else if (command == "infer") {
            rc = cmd_infer(store, rules, config.engine, json_output);
        } else if (command == "prove") {
            rc = cmd_prove(store, rules, config.engine, pattern, json_output);
        } else if (command == "verify") {
            rc = cmd_verify(store, rules, argument);
        } else if (command == "import") {
            rc = cmd_import(store, argument);
        } else if (command == "export") {
            export_ntriples(store, std::cout);
            rc = 0;
        } else if (command == "compact") {
            rc = cmd_compact(store);
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            print_usage(argv[0]);
        }

        store.close();
        return rc;
    } catch (const LogicError& e) {
        std::cerr << "[" << command << "] " << e.what() << "\n";
        return e.kind() == LogicErrorKind::InvalidProof ? 2 : 1;
    } catch (const GraphError& e) {
        std::cerr << "[" << command << "] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[" << command << "] " << e.what() << "\n";
        return 1;
    }
}

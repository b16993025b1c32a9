#include <nyaya/nyaya.hpp>
#include <iostream>
#include <atomic>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <thread>

using namespace nyaya;

Triple make(const std::string& s, const std::string& p, Value o) {
    return Triple(NodeId::named(s), Predicate(p), std::move(o));
}

std::set<Triple> as_set(const std::vector<Triple>& v) {
    return std::set<Triple>(v.begin(), v.end());
}

// Storage contract shared by every backend
void check_backend_contract(StorageBackend& backend) {
    Triple a = make("alice", "knows", Value::node("bob"));
    Triple b = make("alice", "age", Value::integer(30));
    TripleId ia = triple_id(a);
    TripleId ib = triple_id(b);

    assert(backend.count() == 0);
    assert(!backend.get(ia).has_value());
    assert(!backend.remove(ia));

    backend.put(ia, a);
    backend.put(ib, b);
    backend.put(ia, a);
    assert(backend.count() == 2);
    assert(backend.exists(ia));
    assert(backend.get(ia) == a);
    assert(backend.get(ib) == b);
    assert(as_set(backend.iter_all()) == as_set({a, b}));

    assert(backend.remove(ia));
    assert(!backend.exists(ia));
    assert(!backend.remove(ia));
    assert(backend.count() == 1);

    backend.flush();
    backend.close();
    bool threw = false;
    try {
        backend.get(ib);
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::BackendUnavailable;
    }
    assert(threw);
}

void test_node_ids() {
    std::cout << "Testing NodeId..." << std::endl;

    NodeId alice = NodeId::named("http://example.org/people#alice");
    assert(alice.to_string() == "<http://example.org/people#alice>");
    assert(alice.namespace_part() == "http://example.org/people#");
    assert(alice.local_name() == "alice");
    assert(NodeId::parse(alice.to_string()) == alice);

    NodeId b1 = NodeId::blank();
    NodeId b2 = NodeId::blank();
    assert(b1.is_blank() && b1 != b2);
    assert(b1.to_string().size() == 3 + 32);
    assert(NodeId::parse(b1.to_string()) == b1);
    assert(!NodeId::parse("_:bnothex").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_values() {
    std::cout << "Testing Value..." << std::endl;

    assert(Value::integer(3) != Value::floating(3.0));
    assert(compare_values(Value::integer(3), Value::floating(3.0)) == 0);
    assert(compare_values(Value::integer(2), Value::floating(2.5)) < 0);
    assert(!compare_values(Value::string("a"), Value::integer(1)).has_value());

    assert(Value::floating(std::nan("")) == Value::floating(-std::nan("")));
    assert(Value::floating(0.0) != Value::floating(-0.0));
    assert(Value::integer(7).as_float() == 7.0);
    assert(!Value::string("7").as_integer().has_value());

    assert(Value::string("hi").to_string() == "\"hi\"");
    assert(Value::floating(1.0).to_string() == "1.0");
    assert(Value::boolean(true).to_string() == "true");

    std::cout << "  PASS" << std::endl;
}

void test_codec() {
    std::cout << "Testing codec..." << std::endl;

    std::vector<Triple> samples = {
        make("a", "p", Value::node("b")),
        make("a", "p", Value::node(NodeId::blank())),
        make("a", "p", Value::string("line\nbreak \"quoted\"")),
        make("a", "p", Value::integer(-42)),
        make("a", "p", Value::floating(2.5)),
        make("a", "p", Value::boolean(false)),
        Triple(NodeId::blank(), Predicate("p"), Value::string("")),
    };
    for (const auto& t : samples) {
        auto bytes = encode(t);
        assert(bytes[0] == NYAYA_CODEC_VERSION);
        assert(decode_triple(bytes) == t);
    }

    auto bytes = encode(samples[0]);
    bool threw = false;
    try {
        decode_triple(bytes.data(), bytes.size() - 1);
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::Serialization;
    }
    assert(threw);

    bytes.push_back(0);
    threw = false;
    try {
        decode_triple(bytes);
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::Serialization;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_content_addressing() {
    std::cout << "Testing content addressing..." << std::endl;

    Triple t1 = make("alice", "knows", Value::node("bob"));
    Triple t2 = make("alice", "knows", Value::node("bob"));
    assert(triple_id(t1) == triple_id(t2));

    assert(triple_id(t1) != triple_id(make("alice2", "knows", Value::node("bob"))));
    assert(triple_id(t1) != triple_id(make("alice", "knows2", Value::node("bob"))));
    assert(triple_id(t1) != triple_id(make("alice", "knows", Value::string("bob"))));
    assert(triple_id(make("a", "n", Value::integer(1))) != triple_id(make("a", "n", Value::floating(1.0))));

    std::string hex = triple_id(t1).to_hex();
    assert(hex.size() == 64);
    assert(TripleId::from_hex(hex) == triple_id(t1));
    assert(!TripleId::from_hex("abc").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_memory_backend() {
    std::cout << "Testing MemoryBackend..." << std::endl;
    MemoryBackend backend;
    check_backend_contract(backend);
    std::cout << "  PASS" << std::endl;
}

void test_sqlite_backend() {
    std::cout << "Testing SqliteBackend..." << std::endl;
    SqliteBackend backend(":memory:");
    check_backend_contract(backend);
    std::cout << "  PASS" << std::endl;
}

void test_log_backend() {
    std::cout << "Testing LogBackend..." << std::endl;
    std::system("rm -f /tmp/nyaya_log_contract.log");
    LogBackend backend("/tmp/nyaya_log_contract.log");
    check_backend_contract(backend);
    std::cout << "  PASS" << std::endl;
}

void test_backend_equivalence() {
    std::cout << "Testing backend equivalence..." << std::endl;

    std::system("rm -f /tmp/nyaya_equiv.log");
    GraphStore memory(std::make_unique<MemoryBackend>());
    GraphStore sqlite(std::make_unique<SqliteBackend>(":memory:"));
    GraphStore log(std::make_unique<LogBackend>("/tmp/nyaya_equiv.log"));
    std::vector<GraphStore*> stores = {&memory, &sqlite, &log};

    std::vector<Triple> history;
    for (int i = 0; i < 40; ++i) {
        std::string s = "n" + std::to_string(i % 7);
        history.push_back(make(s, i % 2 ? "links" : "rank", i % 2 ? Value::node("n" + std::to_string(i % 5))
                                                                   : Value::integer(i % 3)));
    }
    for (auto* store : stores) {
        for (const auto& t : history) store->insert(t);
        for (size_t i = 0; i < history.size(); i += 3) store->remove(triple_id(history[i]));
    }

    std::vector<TriplePattern> patterns = {
        TriplePattern::any(),
        TriplePattern::any().with_subject(NodeId::named("n3")),
        TriplePattern::any().with_predicate(Predicate("links")),
        TriplePattern::any().with_object(Value::integer(1)),
        TriplePattern::any().with_subject(NodeId::named("n1")).with_object(Value::node("n1")),
        TriplePattern::exact(history[1]),
        TriplePattern::exact(history[0]),
    };
    for (const auto& p : patterns) {
        auto expected = as_set(memory.find(p));
        assert(as_set(sqlite.find(p)) == expected);
        assert(as_set(log.find(p)) == expected);
    }
    assert(memory.count() == sqlite.count());
    assert(memory.count() == log.count());

    std::cout << "  PASS" << std::endl;
}

void test_log_torn_tail() {
    std::cout << "Testing LogBackend torn tail..." << std::endl;

    const std::string path = "/tmp/nyaya_torn.log";
    std::system("rm -f /tmp/nyaya_torn.log");

    Triple a = make("a", "p", Value::integer(1));
    Triple b = make("b", "p", Value::integer(2));
    Triple c = make("c", "p", Value::integer(3));
    {
        LogBackend backend(path);
        backend.put(triple_id(a), a);
        backend.put(triple_id(b), b);
        backend.remove(triple_id(a));
        backend.flush();
    }

    // Half-written entry at the end
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        const char junk[] = "NYLG-partial";
        out.write(junk, sizeof(junk));
    }

    {
        LogBackend backend(path);
        assert(backend.count() == 1);
        assert(backend.get(triple_id(b)) == b);
        assert(!backend.exists(triple_id(a)));
        backend.put(triple_id(c), c);
        backend.flush();
    }

    {
        LogBackend backend(path);
        assert(backend.count() == 2);
        assert(backend.get(triple_id(c)) == c);

        size_t before = backend.size_bytes();
        size_t reclaimed = backend.compact();
        assert(reclaimed > 0);
        assert(backend.size_bytes() == before - reclaimed);
        assert(backend.count() == 2);
    }

    {
        LogBackend backend(path);
        assert(as_set(backend.iter_all()) == as_set({b, c}));
    }

    std::cout << "  PASS" << std::endl;
}

std::vector<char> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::vector<char>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

uint32_t entry_length(const std::vector<char>& bytes, size_t offset) {
    LogEntryHeader header;
    std::memcpy(&header, bytes.data() + offset, sizeof(header));
    return header.length;
}

void test_log_checksum_mismatch() {
    std::cout << "Testing LogBackend checksum mismatch..." << std::endl;

    const std::string path = "/tmp/nyaya_crc.log";
    std::system("rm -f /tmp/nyaya_crc.log");

    Triple a = make("a", "p", Value::integer(1));
    Triple b = make("b", "p", Value::integer(2));
    Triple c = make("c", "p", Value::integer(3));
    {
        LogBackend backend(path);
        backend.put(triple_id(a), a);
        backend.put(triple_id(b), b);
        backend.put(triple_id(c), c);
        backend.flush();
    }

    // Flip the last payload byte of the second entry
    auto bytes = read_file(path);
    uint32_t first = entry_length(bytes, 0);
    uint32_t second = entry_length(bytes, first);
    assert(first + second < bytes.size());
    bytes[first + second - 1] ^= 0x5A;
    write_file(path, bytes);

    {
        LogBackend backend(path);
        assert(backend.count() == 1);
        assert(backend.get(triple_id(a)) == a);
        assert(!backend.exists(triple_id(b)));
        assert(!backend.exists(triple_id(c)));
        assert(backend.size_bytes() == first);

        backend.put(triple_id(c), c);
        backend.flush();
    }

    {
        LogBackend backend(path);
        assert(as_set(backend.iter_all()) == as_set({a, c}));
    }

    std::cout << "  PASS" << std::endl;
}

void test_undecodable_entry() {
    std::cout << "Testing undecodable log entry..." << std::endl;

    const std::string path = "/tmp/nyaya_undecodable.log";
    std::system("rm -f /tmp/nyaya_undecodable.log");

    Triple a = make("a", "p", Value::integer(1));
    Triple b = make("b", "p", Value::integer(2));
    {
        LogBackend backend(path);
        backend.put(triple_id(a), a);
        backend.put(triple_id(b), b);
        backend.flush();
    }

    // Unknown codec version in the first payload, under a valid checksum
    auto bytes = read_file(path);
    LogEntryHeader header;
    std::memcpy(&header, bytes.data(), sizeof(header));
    const size_t payload = sizeof(header) + 32;
    bytes[payload] = 0x7F;
    header.checksum = crc32(reinterpret_cast<const uint8_t*>(bytes.data()) + sizeof(header),
                            header.length - sizeof(header));
    std::memcpy(bytes.data(), &header, sizeof(header));
    write_file(path, bytes);

    {
        GraphStore store(std::make_unique<LogBackend>(path));
        assert(store.count() == 1);
        assert(store.find(TriplePattern::any()) == std::vector<Triple>{b});
        assert(store.contains(triple_id(a)));

        bool threw = false;
        try {
            store.get(triple_id(a));
        } catch (const GraphError& e) {
            threw = e.kind() == GraphErrorKind::Serialization;
        }
        assert(threw);

        assert(store.remove(triple_id(a)));
        assert(!store.contains(triple_id(a)));
        assert(!store.remove(triple_id(a)));
        store.flush();
    }

    {
        LogBackend backend(path);
        assert(backend.count() == 1);
        assert(backend.get(triple_id(b)) == b);
    }

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_reopen() {
    std::cout << "Testing SqliteBackend reopen..." << std::endl;

    const std::string path = "/tmp/nyaya_reopen.db";
    std::system("rm -f /tmp/nyaya_reopen.db /tmp/nyaya_reopen.db-wal /tmp/nyaya_reopen.db-shm");

    Triple t = make("alice", "knows", Value::node("bob"));
    {
        GraphStore store(std::make_unique<SqliteBackend>(path));
        store.insert(t);
        store.insert(make("alice", "age", Value::integer(30)));
        store.flush();
        store.close();
    }
    {
        GraphStore store(std::make_unique<SqliteBackend>(path));
        assert(store.count() == 2);
        auto hits = store.find(TriplePattern::any().with_predicate(Predicate("knows")));
        assert(hits.size() == 1 && hits[0] == t);
        assert(store.stats().storage_bytes > 0);
    }

    std::cout << "  PASS" << std::endl;
}

void test_idempotent_insert() {
    std::cout << "Testing idempotent insert..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    Triple t = make("alice", "knows", Value::node("bob"));

    TripleId first = store.insert(t);
    TripleId second = store.insert(t);
    assert(first == second);
    assert(store.stats().triple_count == 1);

    assert(!store.insert_checked(t).second);
    bool threw = false;
    try {
        store.insert_strict(t);
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::Duplicate;
    }
    assert(threw);

    threw = false;
    try {
        store.insert(make("alice", "", Value::integer(1)));
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::InvalidTriple;
    }
    assert(threw);
    assert(store.count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_insert() {
    std::cout << "Testing concurrent insert..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    std::atomic<size_t> novel{0};
    std::vector<std::thread> threads;
    for (int w = 0; w < 4; ++w) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                if (store.insert_checked(make("n" + std::to_string(i), "p", Value::integer(i))).second) {
                    ++novel;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(novel == 200);
    assert(store.count() == 200);

    std::cout << "  PASS" << std::endl;
}

void test_find_patterns() {
    std::cout << "Testing find..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    Triple t1 = make("alice", "knows", Value::node("bob"));
    Triple t2 = make("alice", "knows", Value::node("carol"));
    Triple t3 = make("bob", "knows", Value::node("carol"));
    Triple t4 = make("alice", "age", Value::integer(30));
    store.insert_batch({t1, t2, t3, t4, t1});

    assert(as_set(store.find(TriplePattern::any())) == as_set({t1, t2, t3, t4}));
    assert(as_set(store.find(TriplePattern::any().with_subject(NodeId::named("alice")))) ==
           as_set({t1, t2, t4}));
    assert(as_set(store.find(TriplePattern::any().with_object(Value::node("carol")))) ==
           as_set({t2, t3}));
    assert(as_set(store.find(TriplePattern::any().with_subject(NodeId::named("alice"))
                                                 .with_predicate(Predicate("knows")))) ==
           as_set({t1, t2}));
    assert(store.find(TriplePattern::exact(t3)).size() == 1);
    assert(store.find(TriplePattern::any().with_subject(NodeId::named("nobody"))).empty());

    // Literal "bob" is not the node <bob>
    assert(store.find(TriplePattern::any().with_object(Value::string("bob"))).empty());

    std::cout << "  PASS" << std::endl;
}

void test_index_staleness() {
    std::cout << "Testing index maintenance..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    Triple t = make("alice", "knows", Value::node("bob"));
    TripleId id = store.insert(t);
    assert(store.remove(id));
    assert(!store.remove(id));

    auto s = store.stats();
    assert(s.triple_count == 0);
    assert(s.subject_count == 0);
    assert(s.predicate_count == 0);
    assert(s.object_count == 0);
    assert(store.find(TriplePattern::any().with_predicate(Predicate("knows"))).empty());

    // Writes behind the store's back become visible after a rebuild
    store.backend().put(id, t);
    assert(store.count() == 0);
    assert(store.rebuild_indices() == 1);
    assert(store.find(TriplePattern::any().with_subject(NodeId::named("alice"))).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_query_paging() {
    std::cout << "Testing query paging..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    for (int i = 0; i < 25; ++i) store.insert(make("item", "has", Value::integer(i)));
    store.insert(make("other", "has", Value::integer(0)));

    TriplePattern items = TriplePattern::any().with_subject(NodeId::named("item"));
    auto page1 = store.query(items).limit(10).execute();
    auto page2 = store.query(items).limit(10).offset(10).execute();
    auto page3 = store.query(items).limit(10).offset(20).execute();

    assert(page1.total_count == 25);
    assert(page1.triples.size() == 10 && page1.has_more);
    assert(page2.triples.size() == 10 && page2.has_more);
    assert(page3.triples.size() == 5 && !page3.has_more);

    std::set<Triple> seen;
    for (const auto* page : {&page1, &page2, &page3}) {
        for (size_t i = 1; i < page->triples.size(); ++i) {
            assert(triple_id(page->triples[i - 1]) < triple_id(page->triples[i]));
        }
        seen.insert(page->triples.begin(), page->triples.end());
    }
    assert(seen.size() == 25);

    auto past = store.query(items).offset(100).execute();
    assert(past.triples.empty() && !past.has_more && past.total_count == 25);

    std::cout << "  PASS" << std::endl;
}

void test_traverse() {
    std::cout << "Testing traverse..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    store.insert(make("a", "next", Value::node("b")));
    store.insert(make("b", "next", Value::node("c")));
    store.insert(make("c", "next", Value::node("a")));
    store.insert(make("b", "see", Value::node("d")));
    store.insert(make("c", "label", Value::string("not a node")));

    auto all = store.traverse(NodeId::named("a"));
    std::set<NodeId> reached(all.begin(), all.end());
    assert(all.size() == 3);
    assert(reached == std::set<NodeId>({NodeId::named("b"), NodeId::named("c"), NodeId::named("d")}));

    auto along_next = store.traverse(NodeId::named("a"), {Predicate("next")});
    assert(along_next.size() == 2);

    assert(store.traverse(NodeId::named("d")).empty());

    std::cout << "  PASS" << std::endl;
}

void test_oversized_field() {
    std::cout << "Testing oversized field rejection..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    std::string big(MAX_FIELD_BYTES + 1, 'x');

    auto rejected = [&](const Triple& t) {
        try {
            store.insert(t);
        } catch (const GraphError& e) {
            return e.kind() == GraphErrorKind::InvalidTriple;
        }
        return false;
    };
    assert(rejected(make("doc", "body", Value::string(big))));
    assert(rejected(make("doc", "link", Value::node(big))));
    assert(rejected(make(big, "body", Value::string("short"))));
    assert(rejected(make("doc", big, Value::string("short"))));
    assert(store.count() == 0);
    assert(store.find(TriplePattern::any()).empty());

    bool threw = false;
    try {
        encode(make("doc", "body", Value::string(big)));
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::InvalidTriple;
    }
    assert(threw);

    // The largest field the codec reads back is accepted
    Triple edge = make("doc", "body", Value::string(std::string(MAX_FIELD_BYTES, 'y')));
    TripleId id = store.insert(edge);
    assert(store.get(id) == edge);
    assert(store.find(TriplePattern::any().with_predicate(Predicate("body"))).size() == 1);
    assert(store.rebuild_indices() == 1);
    assert(store.remove(id));
    assert(store.count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_ntriples() {
    std::cout << "Testing N-Triples..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    NodeId blank = NodeId::blank();
    std::vector<Triple> facts = {
        make("http://ex.org/alice", "http://ex.org/knows", Value::node("http://ex.org/bob")),
        make("http://ex.org/alice", "http://ex.org/name", Value::string("Alice \"Al\"\nSmith")),
        make("http://ex.org/alice", "http://ex.org/age", Value::integer(30)),
        make("http://ex.org/alice", "http://ex.org/height", Value::floating(1.68)),
        make("http://ex.org/alice", "http://ex.org/active", Value::boolean(true)),
        Triple(blank, Predicate("http://ex.org/about"), Value::node("http://ex.org/alice")),
    };
    store.insert_batch(facts);

    std::ostringstream out;
    assert(export_ntriples(store, out) == facts.size());

    GraphStore copy(std::make_unique<MemoryBackend>());
    std::istringstream in(out.str());
    assert(import_ntriples(copy, in) == facts.size());
    assert(as_set(copy.find(TriplePattern::any())) == as_set(facts));

    auto parsed = parse_ntriples(
        "# comment\n"
        "\n"
        "<s> <p> \"hello\"@en .\n"
        "<s> <p> \"12\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n"
        "_:x <p> _:x .\n");
    assert(parsed.size() == 3);
    assert(parsed[0].object == Value::string("hello"));
    assert(parsed[1].object == Value::integer(12));
    assert(parsed[2].subject.is_blank());
    assert(Value::node(parsed[2].subject) == parsed[2].object);

    // Names that IRIREF cannot hold verbatim are written as escapes
    Triple odd = make("a>b\nc", "has part", Value::node("x y"));
    std::string line = to_ntriples(odd);
    assert(line == "<a\\u003Eb\\u000Ac> <has\\u0020part> <x\\u0020y> .");
    assert(parse_ntriples(line + "\n") == std::vector<Triple>{odd});

    GraphStore odd_store(std::make_unique<MemoryBackend>());
    odd_store.insert(odd);
    std::ostringstream odd_out;
    export_ntriples(odd_store, odd_out);
    std::istringstream odd_in(odd_out.str());
    GraphStore odd_copy(std::make_unique<MemoryBackend>());
    assert(import_ntriples(odd_copy, odd_in) == 1);
    assert(odd_copy.find(TriplePattern::any()) == std::vector<Triple>{odd});

    auto escaped = parse_ntriples("<caf\\u00E9> <p> \"smile \\U0001F600\" .\n");
    assert(escaped.size() == 1);
    assert(escaped[0].subject == NodeId::named("caf\xC3\xA9"));
    assert(escaped[0].object == Value::string("smile \xF0\x9F\x98\x80"));

    auto parse_fails = [](const std::string& text) {
        try {
            parse_ntriples(text);
        } catch (const GraphError& e) {
            return e.kind() == GraphErrorKind::Serialization;
        }
        return false;
    };
    assert(parse_fails("<s\\uD800> <p> <o> .\n"));
    assert(parse_fails("<s\\u00G1> <p> <o> .\n"));
    assert(parse_fails("<s\\n> <p> <o> .\n"));

    bool threw = false;
    try {
        parse_ntriples("<s> <p> <o> .\n<s> <p> \"unterminated .\n");
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::Serialization &&
                std::string(e.what()).find("line 2") != std::string::npos;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_scenario() {
    std::cout << "Testing insert/find/remove scenario..." << std::endl;

    GraphStore store(std::make_unique<MemoryBackend>());
    Triple t = make("alice", "knows", Value::node("bob"));
    TripleId id = store.insert(t);

    auto hits = store.find(TriplePattern::any().with_subject(NodeId::named("alice")));
    assert(hits.size() == 1 && hits[0] == t);

    assert(store.remove(id));
    assert(store.find(TriplePattern::any().with_subject(NodeId::named("alice"))).empty());

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config..." << std::endl;

    const std::string path = "/tmp/nyaya_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"storage": {"backend": "memory"},
                   "engine": {"max_depth": 5},
                   "validator": {"functional": ["age"], "exclusive": [["alive", "dead"]]}})";
    }
    Config config = load_config(path);
    assert(config.storage.kind == BackendKind::Memory);
    assert(config.engine.max_depth == 5);
    assert(config.engine.max_iterations == EngineConfig().max_iterations);
    assert(config.validator.functional_predicates.count("age") == 1);
    assert(config.validator.exclusive_pairs.size() == 1);

    GraphStore store(open_backend(config.storage));
    assert(std::string(store.backend().name()) == "memory");

    {
        std::ofstream out(path);
        out << R"({"storage": {"backend": "floppy"}})";
    }
    bool threw = false;
    try {
        load_config(path);
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::Config;
    }
    assert(threw);

    for (const char* bad : {R"({"engine": {"max_iterations": -1}})",
                            R"({"engine": {"max_depth": -3}})",
                            R"({"engine": {"max_depth": "deep"}})"}) {
        {
            std::ofstream out(path);
            out << bad;
        }
        threw = false;
        try {
            load_config(path);
        } catch (const GraphError& e) {
            threw = e.kind() == GraphErrorKind::Config;
        }
        assert(threw);
    }

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    threw = false;
    try {
        load_config(path);
    } catch (const GraphError& e) {
        threw = e.kind() == GraphErrorKind::Config;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Nyaya Graph Tests ===" << std::endl;

    test_node_ids();
    test_values();
    test_codec();
    test_content_addressing();

    std::cout << std::endl;
    std::cout << "=== Storage Backends ===" << std::endl;
    test_memory_backend();
    test_sqlite_backend();
    test_log_backend();
    test_backend_equivalence();
    test_log_torn_tail();
    test_log_checksum_mismatch();
    test_undecodable_entry();
    test_sqlite_reopen();

    std::cout << std::endl;
    std::cout << "=== Graph Store ===" << std::endl;
    test_idempotent_insert();
    test_concurrent_insert();
    test_find_patterns();
    test_index_staleness();
    test_query_paging();
    test_traverse();
    test_oversized_field();
    test_ntriples();
    test_scenario();
    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}

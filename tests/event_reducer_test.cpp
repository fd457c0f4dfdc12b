#include "event_reducer.h"
#include "logger.h"
#include "test_support.h"

#include <cassert>
#include <iostream>
#include <sstream>

int main() {
    std::ostringstream sink;
    Logger log("reducer_test", sink);
    log.set_level(LogLevel::DEBUG);

    MemoryUriStore store({"otpauth://totp/ACME:a?secret=AAAA", "otpauth://totp/ACME:b?secret=BBBB"});
    EventReducer reducer(store, log);

    auto gen_a = std::make_shared<const CountingGenerator>(111111);
    auto gen_b = std::make_shared<const CountingGenerator>(222222);
    const Snapshot s0 = make_snapshot({
        make_entry("a", gen_a, "otpauth://totp/ACME:a?secret=AAAA"),
        make_entry("b", gen_b, "otpauth://totp/ACME:b?secret=BBBB"),
    });
    assert((*s0)[0].code == "111111");
    assert((*s0)[1].code == "222222");

    // Regenerate: codes advance per generator, order kept
    const Snapshot s1 = reducer.apply(s0, RegenerateEvent{});
    assert(s1->size() == 2);
    assert((*s1)[0].account == "a" && (*s1)[0].code == "111112");
    assert((*s1)[1].account == "b" && (*s1)[1].code == "222223");
    assert((*s1)[0].generator == gen_a);
    // the previous snapshot is untouched
    assert((*s0)[0].code == "111111");

    // Delete(A'): only A goes, store asked to drop A's uri
    const OtpEntry a1 = (*s1)[0];
    const Snapshot s2 = reducer.apply(s1, DeleteEvent{a1});
    assert(s2->size() == 1);
    assert((*s2)[0] == (*s1)[1]);
    assert(store.removals().size() == 1);
    assert(store.removals()[0] == a1.uri);
    assert(store.list_uri_strings().size() == 1);

    // Delete(A') again: collection no-op, store removal still attempted
    const Snapshot s3 = reducer.apply(s2, DeleteEvent{a1});
    assert(s3->size() == 1);
    assert((*s3)[0] == (*s2)[0]);
    assert(store.removals().size() == 2);

    // A stale value (older code) still targets the right entry
    const OtpEntry b_stale = (*s0)[1];
    const Snapshot s4 = reducer.apply(reducer.apply(s3, RegenerateEvent{}), DeleteEvent{b_stale});
    assert(s4->empty());

    // Count property over an interleaved sequence
    {
        std::vector<std::shared_ptr<const CountingGenerator>> gens;
        OtpEntries init;
        for (int i = 0; i < 5; ++i) {
            gens.push_back(std::make_shared<const CountingGenerator>(100000u * (i + 1)));
            init.push_back(make_entry("acct" + std::to_string(i), gens.back(),
                                      "otpauth://totp/x" + std::to_string(i) + "?secret=AAAA"));
        }
        Snapshot s = make_snapshot(init);
        s = reducer.apply(s, RegenerateEvent{});
        s = reducer.apply(s, DeleteEvent{init[3]});
        s = reducer.apply(s, RegenerateEvent{});
        s = reducer.apply(s, RegenerateEvent{});
        s = reducer.apply(s, DeleteEvent{init[0]});
        s = reducer.apply(s, DeleteEvent{init[0]});   // duplicate, no match
        s = reducer.apply(s, RegenerateEvent{});
        assert(s->size() == 3);
        assert((*s)[0].account == "acct1");
        assert((*s)[1].account == "acct2");
        assert((*s)[2].account == "acct4");
        // bootstrap call + four regenerates
        assert(gens[1]->calls() == 5);
        assert((*s)[0].code == "200004");
    }

    // A failing generator keeps its previous code; the others still advance
    {
        auto bad = std::make_shared<const FailingGenerator>(1);
        auto good = std::make_shared<const CountingGenerator>(500000);
        Snapshot s = make_snapshot({make_entry("bad", bad, "otpauth://totp/bad?secret=AAAA"),
                                    make_entry("good", good, "otpauth://totp/good?secret=AAAA")});
        s = reducer.apply(s, RegenerateEvent{});
        assert(s->size() == 2);
        assert((*s)[0].code == "424242");
        assert((*s)[1].code == "500001");
        assert(sink.str().find("regenerate failed for bad") != std::string::npos);
    }

    // A throwing store does not stop the in-memory delete
    {
        store.fail_removals(true);
        auto g = std::make_shared<const CountingGenerator>(1);
        Snapshot s = make_snapshot({make_entry("c", g, "otpauth://totp/c?secret=AAAA")});
        s = reducer.apply(s, DeleteEvent{(*s)[0]});
        assert(s->empty());
        assert(sink.str().find("store removal failed") != std::string::npos);
        store.fail_removals(false);
    }

    assert(reducer.reductions() == 14);

    std::cout << "EventReducer test passed.\n";
    return 0;
}

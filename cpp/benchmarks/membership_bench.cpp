#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "warden/db/db.hpp"
#include "warden/db/session.hpp"
#include "warden/directory/group_store.hpp"
#include "warden/directory/membership_index.hpp"
#include "warden/directory/user_store.hpp"

using namespace warden;
using namespace warden::core;

namespace {

// A chain g0 <- g1 <- ... <- g(depth-1), each level also holding `width`
// users of its own.
struct Fixture {
    db::DbHandle db{};
    RequestContext ctx;
    directory::FlatTableIndex index;
    directory::GroupStore groups{index};
    directory::UserStore users{groups};
    int depth{0};

    Fixture(int depth_, int width) : depth(depth_) {
        if (!is_ok(db::db_open(db::DbConfig{}, &db))) {
            return;
        }
        const Status s = db::db_write(db, "bench_setup", ctx, [&](db::DbSession& session) {
            for (int g = 0; g < depth; ++g) {
                const std::string name = "g" + std::to_string(g);
                Status st = groups.create_group(session, GroupName{name}, Email{name + "@bench.local"}, {});
                if (!is_ok(st)) {
                    return st;
                }
                for (int u = 0; u < width; ++u) {
                    const std::string id = name + "-u" + std::to_string(u);
                    st = users.create_user(session, UserId{id}, Email{id + "@bench.local"}, true);
                    if (!is_ok(st)) {
                        return st;
                    }
                    st = groups.add_member(session, GroupName{name}, UserId{id});
                    if (!is_ok(st)) {
                        return st;
                    }
                }
                if (g > 0) {
                    st = groups.add_member(session, GroupName{name}, GroupName{"g" + std::to_string(g - 1)});
                    if (!is_ok(st)) {
                        return st;
                    }
                }
            }
            return ok_status();
        });
        benchmark::DoNotOptimize(s);
    }

    ~Fixture() { (void)db::db_close(db); }

    [[nodiscard]] GroupName top() const { return GroupName{"g" + std::to_string(depth - 1)}; }
};

} // namespace

static void BM_IsMemberDeepChain(benchmark::State& state) {
    Fixture f(static_cast<int>(state.range(0)), 4);
    const GroupName top = f.top();
    const UserId bottom_user{"g0-u0"};
    for (auto _ : state) {
        bool member = false;
        const Status s = db::db_read(f.db, "bench_is_member", f.ctx, [&](db::DbSession& session) {
            return f.groups.is_member(session, top, bottom_user, &member);
        });
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(member);
    }
}
BENCHMARK(BM_IsMemberDeepChain)->Arg(4)->Arg(16)->Arg(64);

static void BM_FlattenTopOfChain(benchmark::State& state) {
    Fixture f(static_cast<int>(state.range(0)), 8);
    const GroupName top = f.top();
    for (auto _ : state) {
        std::vector<UserId> members;
        const Status s = db::db_read(f.db, "bench_flatten", f.ctx, [&](db::DbSession& session) {
            return f.groups.list_flattened_members(session, top, &members);
        });
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(members.size());
    }
}
BENCHMARK(BM_FlattenTopOfChain)->Arg(4)->Arg(16)->Arg(64);

// Linking the bottom of the chain into a fresh group touches every ancestor.
static void BM_AddRemoveEdgeUnderChain(benchmark::State& state) {
    Fixture f(static_cast<int>(state.range(0)), 2);
    (void)db::db_write(f.db, "bench_leaf", f.ctx, [&](db::DbSession& session) {
        return f.groups.create_group(session, GroupName{"leaf"}, Email{"leaf@bench.local"}, {});
    });
    for (auto _ : state) {
        const Status s = db::db_write(f.db, "bench_churn", f.ctx, [&](db::DbSession& session) {
            Status st = f.groups.add_member(session, GroupName{"g0"}, GroupName{"leaf"});
            if (!is_ok(st)) {
                return st;
            }
            return f.groups.remove_member(session, GroupName{"g0"}, GroupName{"leaf"});
        });
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_AddRemoveEdgeUnderChain)->Arg(4)->Arg(16)->Arg(64);

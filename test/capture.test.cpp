#define BOOST_TEST_MODULE Capture Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>
#include <sstream>

#include "allocator.hpp"
#include "base.hpp"
#include "capture.hpp"
#include "log.hpp"
#include "obj.hpp"
#include "values.hpp"

using namespace lox;

// allocate a function with the given upvalue descriptors and no code
static gc_ref<function> mk_fun(allocator* alloc, string_table* tab,
        const string& name, u32 arity,
        std::initializer_list<upvalue_desc> upvals) {
    function f;
    f.name = tab->intern(name);
    f.arity = arity;
    for (auto& u : upvals) {
        f.add_upvalue(u.index, u.is_local);
    }
    return alloc->add_function(std::move(f));
}

// push a frame of plain numbers onto the stack
static void push_numbers(capture_state* S, std::initializer_list<f64> nums) {
    for (auto n : nums) {
        S->stack.push_back(vbox_number(n));
    }
}

BOOST_AUTO_TEST_CASE( capture_local_test ) {
    allocator alloc;
    capture_state S{&alloc};
    push_numbers(&S, {0, 1, 2, 3});

    auto r2 = capture_local(&S, 2);
    auto r0 = capture_local(&S, 0);
    auto r3 = capture_local(&S, 3);
    // capturing again gives back the same upvalue
    BOOST_TEST((capture_local(&S, 2) == r2));
    BOOST_TEST(alloc.live_values() == 3u);

    BOOST_TEST(S.open_upvals.size == 3u);
    BOOST_TEST(S.open_upvals[0].pos == 0u);
    BOOST_TEST(S.open_upvals[1].pos == 2u);
    BOOST_TEST(S.open_upvals[2].pos == 3u);
    BOOST_TEST((S.open_upvals[0].ref == r0));
    BOOST_TEST((S.open_upvals[2].ref == r3));

    BOOST_TEST(vis_open_upvalue(S.stack[2]));
    BOOST_TEST(!vis_open_upvalue(S.stack[1]));
    // the stack slot and the heap slot share one cell
    BOOST_TEST(&vcell(S.stack[2]) == &vcell(r2.unwrap_upgrade()));
    BOOST_TEST((get_local(&S, 2) == vbox_number(2)));
}

BOOST_AUTO_TEST_CASE( push_own_element_test ) {
    // copying a slot to the top of a full stack, as a get-local would
    allocator alloc;
    capture_state S{&alloc};
    S.stack.ensure_capacity(16);
    for (u32 i = 0; i < 16; ++i) {
        S.stack.push_back(vbox_open_upvalue(vbox_number(i)));
    }
    auto cell = S.stack[0].cell;
    S.stack.push_back(S.stack[0]);
    BOOST_TEST(S.stack.size == 17u);
    BOOST_TEST(vis_open_upvalue(S.stack[16]));
    BOOST_TEST((S.stack[16].cell == cell));
    BOOST_TEST((get_local(&S, 16) == vbox_number(0)));

    // same for a plain value and for insert
    dyn_array<value> nums;
    nums.ensure_capacity(16);
    for (u32 i = 0; i < 16; ++i) {
        nums.push_back(vbox_number(i));
    }
    nums.insert(0, nums[15]);
    BOOST_TEST(nums.size == 17u);
    BOOST_TEST((nums[0] == vbox_number(15)));
    BOOST_TEST((nums[1] == vbox_number(0)));
    BOOST_TEST((nums[16] == vbox_number(15)));
}

BOOST_AUTO_TEST_CASE( make_closure_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    // frame: [callee, x, y]
    S.stack.push_back(vbox_nil());
    push_numbers(&S, {10, 20});

    auto fun = mk_fun(&alloc, &tab, "g", 0, {{2, true}, {1, true}});
    auto c = make_closure(&S, 0, nullptr, fun);

    BOOST_TEST(vis_function(c));
    BOOST_TEST((vfunction(c) == fun));
    BOOST_TEST(vcaptures(c).size == 2u);
    BOOST_TEST((get_upvalue(c, 0) == vbox_number(20)));
    BOOST_TEST((get_upvalue(c, 1) == vbox_number(10)));
    BOOST_TEST(v_to_string(c) == "<fn g>");

    // nothing to capture
    auto plain = make_closure(&S, 0, nullptr,
            mk_fun(&alloc, &tab, "h", 0, {}));
    BOOST_TEST(vcaptures(plain).size == 0u);
}

BOOST_AUTO_TEST_CASE( nested_closure_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    push_numbers(&S, {0, 5});

    auto outer = make_closure(&S, 0, nullptr,
            mk_fun(&alloc, &tab, "outer", 0, {{1, true}}));
    // inner is created while outer runs; its frame starts above outer's
    S.stack.push_back(outer);
    push_numbers(&S, {7});
    auto inner = make_closure(&S, 2, &outer,
            mk_fun(&alloc, &tab, "inner", 0, {{0, false}, {1, true}}));

    // the variable from two frames up is shared, not copied
    BOOST_TEST((vcaptures(inner)[0] == vcaptures(outer)[0]));
    BOOST_TEST((get_upvalue(inner, 0) == vbox_number(5)));
    BOOST_TEST((get_upvalue(inner, 1) == vbox_number(7)));

    set_upvalue(inner, 0, vbox_number(6));
    BOOST_TEST((get_upvalue(outer, 0) == vbox_number(6)));
    BOOST_TEST((get_local(&S, 1) == vbox_number(6)));
}

BOOST_AUTO_TEST_CASE( shared_open_upvalue_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    push_numbers(&S, {0, 1});

    auto fun = mk_fun(&alloc, &tab, "f", 0, {{1, true}});
    auto c1 = make_closure(&S, 0, nullptr, fun);
    auto c2 = make_closure(&S, 0, nullptr, fun);
    BOOST_TEST((vcaptures(c1)[0] == vcaptures(c2)[0]));
    BOOST_TEST(S.open_upvals.size == 1u);

    set_upvalue(c1, 0, vbox_number(2));
    BOOST_TEST((get_upvalue(c2, 0) == vbox_number(2)));
    BOOST_TEST((get_local(&S, 1) == vbox_number(2)));

    // writes from the frame are seen by the closures
    set_local(&S, 1, vbox_number(3));
    BOOST_TEST(vis_open_upvalue(S.stack[1]));
    BOOST_TEST((get_upvalue(c1, 0) == vbox_number(3)));

    // storing an UpvaluePtr stores its referent
    auto other = alloc.add_value(vbox_bool(true));
    set_upvalue(c2, 0, vbox_upvalue_ptr(other));
    BOOST_TEST((get_upvalue(c1, 0) == vbox_bool(true)));
    BOOST_TEST(vis_bool(vcell(S.stack[1]).val));
}

BOOST_AUTO_TEST_CASE( close_upvalues_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    push_numbers(&S, {0, 1, 2});

    auto c1 = make_closure(&S, 0, nullptr,
            mk_fun(&alloc, &tab, "a", 0, {{1, true}, {2, true}}));
    auto c2 = make_closure(&S, 0, nullptr,
            mk_fun(&alloc, &tab, "b", 0, {{1, true}}));
    set_local(&S, 1, vbox_number(10));

    // close only the top slot
    close_upvalues(&S, 2);
    BOOST_TEST(S.open_upvals.size == 1u);
    BOOST_TEST(!vis_open_upvalue(S.stack[2]));
    BOOST_TEST(vis_open_upvalue(S.stack[1]));
    BOOST_TEST((S.stack[2] == vbox_number(2)));

    close_upvalues(&S, 0);
    BOOST_TEST(S.open_upvals.size == 0u);
    BOOST_TEST((S.stack[1] == vbox_number(10)));
    // the heap slot now holds the variable itself
    BOOST_TEST(vis_number(vcaptures(c1)[0].unwrap_upgrade()));

    BOOST_TEST((get_upvalue(c1, 0) == vbox_number(10)));
    BOOST_TEST((get_upvalue(c2, 0) == vbox_number(10)));
    BOOST_TEST((get_upvalue(c1, 1) == vbox_number(2)));

    // closures still share the variable after the frame is gone
    S.stack.resize(0);
    set_upvalue(c2, 0, vbox_number(11));
    BOOST_TEST((get_upvalue(c1, 0) == vbox_number(11)));

    // closing with nothing open is a no-op
    close_upvalues(&S, 0);
    BOOST_TEST(alloc.live_values() == 2u);
}

BOOST_AUTO_TEST_CASE( recapture_after_close_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    push_numbers(&S, {0, 1});
    auto fun = mk_fun(&alloc, &tab, "f", 0, {{1, true}});

    auto c1 = make_closure(&S, 0, nullptr, fun);
    close_upvalues(&S, 1);
    // a new capture of the same slot is a new variable
    auto c2 = make_closure(&S, 0, nullptr, fun);
    BOOST_TEST((vcaptures(c1)[0] != vcaptures(c2)[0]));
    set_upvalue(c2, 0, vbox_number(5));
    BOOST_TEST((get_upvalue(c1, 0) == vbox_number(1)));
}

BOOST_AUTO_TEST_CASE( update_through_upvalue_test ) {
    // fun f(n) { fun g() { n; } ... } with n = 1
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    S.stack.push_back(vbox_nil());
    push_numbers(&S, {1.0});

    auto f = mk_fun(&alloc, &tab, "f", 1, {{1, true}});
    auto c = make_closure(&S, 0, nullptr, f);
    close_upvalues(&S, 0);

    auto p = upvalue_ref(c, 0);
    BOOST_TEST(vis_upvalue_ptr(p));
    BOOST_TEST(vupdate_number(p, 2.0));
    BOOST_TEST((vcaptures(c)[0].unwrap_upgrade() == vbox_number(2.0)));
    BOOST_TEST((get_upvalue(c, 0) == vbox_number(2.0)));
    // p itself is unchanged
    BOOST_TEST(vis_upvalue_ptr(p));
}

BOOST_AUTO_TEST_CASE( update_open_upvalue_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    S.stack.push_back(vbox_nil());
    push_numbers(&S, {1.0});

    auto c = make_closure(&S, 0, nullptr,
            mk_fun(&alloc, &tab, "f", 1, {{1, true}}));
    // numeric updates do not reach through an open cell
    auto p = upvalue_ref(c, 0);
    BOOST_TEST(!vupdate_number(p, 2.0));
    BOOST_TEST((get_upvalue(c, 0) == vbox_number(1.0)));
    BOOST_TEST((get_local(&S, 1) == vbox_number(1.0)));
}

BOOST_AUTO_TEST_CASE( capture_errors_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    push_numbers(&S, {0, 1});

    BOOST_CHECK_THROW(capture_local(&S, 2), invariant_violation);
    BOOST_CHECK_THROW(get_local(&S, 5), invariant_violation);

    // non-local capture with no enclosing closure
    auto g = mk_fun(&alloc, &tab, "g", 0, {{0, false}});
    BOOST_CHECK_THROW(make_closure(&S, 0, nullptr, g), invariant_violation);

    // enclosing closure has no such capture
    auto outer = make_closure(&S, 0, nullptr,
            mk_fun(&alloc, &tab, "outer", 0, {}));
    auto h = mk_fun(&alloc, &tab, "h", 0, {{3, false}});
    BOOST_CHECK_THROW(make_closure(&S, 0, &outer, h), invariant_violation);

    BOOST_CHECK_THROW(get_upvalue(outer, 0), invariant_violation);
    BOOST_CHECK_THROW(get_upvalue(vbox_number(1), 0), invariant_violation);
    BOOST_CHECK_THROW(set_upvalue(vbox_nil(), 0, vbox_nil()), invariant_violation);
    BOOST_CHECK_THROW(upvalue_ref(outer, 0), invariant_violation);
}

BOOST_AUTO_TEST_CASE( reclaimed_capture_test ) {
    allocator alloc;
    string_table tab;
    capture_state S{&alloc};
    push_numbers(&S, {0, 1});

    auto c = make_closure(&S, 0, nullptr,
            mk_fun(&alloc, &tab, "f", 0, {{1, true}}));
    close_upvalues(&S, 0);
    alloc.reclaim(vcaptures(c)[0]);
    BOOST_CHECK_THROW(get_upvalue(c, 0), invariant_violation);
    BOOST_CHECK_THROW(upvalue_ref(c, 0), invariant_violation);
}

BOOST_AUTO_TEST_CASE( capture_trace_test ) {
    std::ostringstream err;
    std::ostringstream info;
    logger log{&err, &info};
    alloc_config config;
    config.trace = true;
    allocator alloc{&log, config};
    string_table tab;
    capture_state S{&alloc};
    push_numbers(&S, {0, 1});

    auto fun = mk_fun(&alloc, &tab, "f", 0, {{1, true}});
    make_closure(&S, 0, nullptr, fun);
    BOOST_TEST(info.str().find("opened upvalue for stack address 1 in slot 0")
            != string::npos);
    close_upvalues(&S, 0);
    BOOST_TEST(info.str().find("closed upvalue for stack address 1 in slot 0")
            != string::npos);
    BOOST_TEST(err.str().empty());
}

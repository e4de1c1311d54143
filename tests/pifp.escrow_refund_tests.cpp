#include "pifp.escrow_tester.hpp"

using namespace pifp_test;

BOOST_AUTO_TEST_SUITE(pifp_escrow_refund_tests)

BOOST_FIXTURE_TEST_CASE(expire_unfunded_project, escrow_fixture) try {
   const auto id = new_project(1000, 3600);

   REQUIRE_ERR(err::INVALID_STATE_TRANSITION, expire(ALICE, id));
   REQUIRE_ERR(err::PROJECT_NOT_FOUND, expire(ALICE, 7));

   produce_block(fc::seconds(7200));
   BOOST_REQUIRE_EQUAL(success(), expire(ALICE, id));
   BOOST_REQUIRE_EQUAL("expired"_n, status_of(id));
   produce_blocks();

   REQUIRE_ERR(err::INVALID_STATE_TRANSITION, expire(BOB, id));
   // an expired project is gone for the oracle
   REQUIRE_ERR(err::PROJECT_NOT_FOUND, verifyproof(ORACLE, id, proof_of("milestone-1")));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(completed_project_cannot_expire, escrow_fixture) try {
   const auto id = new_project(1000, 3600);
   BOOST_REQUIRE_EQUAL(success(), verifyproof(ORACLE, id, proof_of("milestone-1")));

   produce_block(fc::seconds(7200));
   REQUIRE_ERR(err::INVALID_STATE_TRANSITION, expire(ALICE, id));
   BOOST_REQUIRE_EQUAL("completed"_n, status_of(id));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(refund_scenario, escrow_fixture) try {
   const auto id = new_project(1000, 3600);
   BOOST_REQUIRE_EQUAL(success(), deposit(TOKEN_A, ALICE, id, "400 AAA"));

   produce_block(fc::seconds(7200));
   BOOST_REQUIRE_EQUAL(success(), expire(BOB, id));

   BOOST_REQUIRE_EQUAL(success(), refund(ALICE, id, token("0,AAA", TOKEN_A)));
   BOOST_REQUIRE_EQUAL(1000000, token_balance(TOKEN_A, ALICE, "AAA"));
   BOOST_REQUIRE_EQUAL(0, contribution(id, ALICE, "AAA"));
   BOOST_REQUIRE_EQUAL(0, pool_balance(id));
   BOOST_REQUIRE_EQUAL(0, token_balance(TOKEN_A, ESCROW, "AAA"));
   produce_blocks();

   REQUIRE_ERR(err::INSUFFICIENT_BALANCE, refund(ALICE, id, token("0,AAA", TOKEN_A)));
   BOOST_REQUIRE_EQUAL(1000000, token_balance(TOKEN_A, ALICE, "AAA"));
   // donor row survives, still counted once
   BOOST_REQUIRE_EQUAL(1u, donation_count(id));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(refund_isolates_donors, escrow_fixture) try {
   const auto id = new_project(10000, 3600, "iso", { token("0,AAA", TOKEN_A), token("0,BBB", TOKEN_B) });
   BOOST_REQUIRE_EQUAL(success(), deposit(TOKEN_A, ALICE, id, "100 AAA"));
   BOOST_REQUIRE_EQUAL(success(), deposit(TOKEN_A, BOB,   id, "250 AAA"));
   BOOST_REQUIRE_EQUAL(success(), deposit(TOKEN_A, ALICE, id, "50 AAA"));
   BOOST_REQUIRE_EQUAL(success(), deposit(TOKEN_B, ALICE, id, "70 BBB"));

   produce_block(fc::seconds(7200));
   BOOST_REQUIRE_EQUAL(success(), expire(CAROL, id));

   BOOST_REQUIRE_EQUAL(success(), refund(ALICE, id, token("0,AAA", TOKEN_A)));
   BOOST_REQUIRE_EQUAL(1000000, token_balance(TOKEN_A, ALICE, "AAA"));
   BOOST_REQUIRE_EQUAL(250, pool_balance(id, 0));
   // other token untouched until claimed separately
   BOOST_REQUIRE_EQUAL(70, contribution(id, ALICE, "BBB"));
   BOOST_REQUIRE_EQUAL(70, pool_balance(id, 1));

   REQUIRE_ERR(err::INSUFFICIENT_BALANCE, refund(CAROL, id, token("0,AAA", TOKEN_A)));
   REQUIRE_ERR(err::INSUFFICIENT_BALANCE, refund(BOB,   id, token("0,BBB", TOKEN_B)));

   BOOST_REQUIRE_EQUAL(success(), refund(BOB, id, token("0,AAA", TOKEN_A)));
   BOOST_REQUIRE_EQUAL(1000000, token_balance(TOKEN_A, BOB, "AAA"));
   BOOST_REQUIRE_EQUAL(success(), refund(ALICE, id, token("0,BBB", TOKEN_B)));
   BOOST_REQUIRE_EQUAL(1000000, token_balance(TOKEN_B, ALICE, "BBB"));

   BOOST_REQUIRE_EQUAL(0, pool_balance(id, 0));
   BOOST_REQUIRE_EQUAL(0, pool_balance(id, 1));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(lazy_expiry_on_refund, escrow_fixture) try {
   const auto id = new_project(1000, 3600);
   BOOST_REQUIRE_EQUAL(success(), deposit(TOKEN_A, ALICE, id, "300 AAA"));

   produce_block(fc::seconds(7200));
   BOOST_REQUIRE_EQUAL("active"_n, status_of(id));

   BOOST_REQUIRE_EQUAL(success(), refund(ALICE, id, token("0,AAA", TOKEN_A)));
   BOOST_REQUIRE_EQUAL("expired"_n, status_of(id));
   BOOST_REQUIRE_EQUAL(1000000, token_balance(TOKEN_A, ALICE, "AAA"));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(refund_guards, escrow_fixture) try {
   const auto id = new_project(1000, 3600);
   BOOST_REQUIRE_EQUAL(success(), deposit(TOKEN_A, ALICE, id, "300 AAA"));

   BOOST_REQUIRE_EQUAL(error("missing authority of alice"), push_action(BOB, "refund"_n,
      mvo()("donor", ALICE)("project_id", id)("token", token("0,AAA", TOKEN_A))));

   // before the deadline
   REQUIRE_ERR(err::INVALID_STATE_TRANSITION, refund(ALICE, id, token("0,AAA", TOKEN_A)));
   REQUIRE_ERR(err::PROJECT_NOT_FOUND, refund(ALICE, 99, token("0,AAA", TOKEN_A)));
   REQUIRE_ERR(err::TOKEN_NOT_ACCEPTED, refund(ALICE, id, token("0,BBB", TOKEN_B)));

   // after release
   BOOST_REQUIRE_EQUAL(success(), verifyproof(ORACLE, id, proof_of("milestone-1")));
   produce_block(fc::seconds(7200));
   REQUIRE_ERR(err::MILESTONE_ALREADY_RELEASED, refund(ALICE, id, token("0,AAA", TOKEN_A)));
   BOOST_REQUIRE_EQUAL(300, token_balance(TOKEN_A, MANAGER, "AAA"));
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()

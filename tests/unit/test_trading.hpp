#pragma once

namespace perpcore::tests {

void test_open_close_round_trip();
void test_close_in_profit();
void test_resting_order_lifecycle();
void test_order_validation();
void test_linked_orders();
void test_protocol_fee_share();
void test_collateral_adjustments();

}  // namespace perpcore::tests

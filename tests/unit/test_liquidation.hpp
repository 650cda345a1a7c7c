#pragma once

namespace perpcore::tests {

void test_margin_check();
void test_liquidation_threshold();
void test_liquidation_payout();

}  // namespace perpcore::tests

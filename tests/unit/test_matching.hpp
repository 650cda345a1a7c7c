#pragma once

namespace perpcore::tests {

void test_linked_orders_share_a_level();
void test_match_level_order();
void test_orphaned_linked_order_released();

}  // namespace perpcore::tests

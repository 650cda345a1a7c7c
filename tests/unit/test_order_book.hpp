#pragma once

namespace perpcore::tests {

void test_order_book_triggers();
void test_position_store();

}  // namespace perpcore::tests

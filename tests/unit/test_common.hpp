#pragma once

namespace perpcore::tests {

void test_signed_amount();
void test_fixed_point();

}  // namespace perpcore::tests

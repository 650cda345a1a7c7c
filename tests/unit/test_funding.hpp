#pragma once

namespace perpcore::tests {

void test_funding_accrual();
void test_funding_sign_flip();

}  // namespace perpcore::tests

#pragma once

namespace perpcore::tests {

void test_failed_operation_is_atomic();
void test_authorization();
void test_admin_validation();
void test_open_interest_cleanup();
void test_open_interest_sweep_resumes();
void test_admin_publish_failure();
void test_transaction_restore();
void test_custody_routing();

}  // namespace perpcore::tests

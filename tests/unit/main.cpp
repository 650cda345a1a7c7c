// Unit test runner - calls test functions from per-component test files

#include "test_common.hpp"
#include "test_config.hpp"
#include "test_fees.hpp"
#include "test_funding.hpp"
#include "test_liquidation.hpp"
#include "test_matching.hpp"
#include "test_options.hpp"
#include "test_order_book.hpp"
#include "test_persistence.hpp"
#include "test_registry.hpp"
#include "test_telemetry.hpp"
#include "test_trading.hpp"

int main() {
  using namespace perpcore::tests;

  // Arithmetic tests
  test_signed_amount();
  test_fixed_point();

  // Fee tests
  test_dynamic_fee_rate();
  test_fee_amounts();

  // Book tests
  test_order_book_triggers();
  test_position_store();

  // Trading tests
  test_open_close_round_trip();
  test_close_in_profit();
  test_resting_order_lifecycle();
  test_order_validation();
  test_linked_orders();
  test_protocol_fee_share();
  test_collateral_adjustments();

  // Matching tests
  test_linked_orders_share_a_level();
  test_match_level_order();
  test_orphaned_linked_order_released();

  // Funding tests
  test_funding_accrual();
  test_funding_sign_flip();

  // Liquidation tests
  test_margin_check();
  test_liquidation_threshold();
  test_liquidation_payout();

  // Option collateral tests
  test_option_collateral_escrow();
  test_option_liquidation_escrow();
  test_settlement_resumes();

  // Registry tests
  test_failed_operation_is_atomic();
  test_authorization();
  test_admin_validation();
  test_open_interest_cleanup();
  test_open_interest_sweep_resumes();
  test_admin_publish_failure();
  test_transaction_restore();
  test_custody_routing();

  // Telemetry tests
  test_telemetry_sink();
  test_registry_telemetry();

  // Journal tests
  test_journal_replay();
  test_registry_journal();
  test_journal_recovery();

  // Config tests
  test_config_default();
  test_config_validation();

  return 0;
}

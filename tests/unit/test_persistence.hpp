#pragma once

namespace perpcore::tests {

void test_journal_replay();
void test_registry_journal();
void test_journal_recovery();

}  // namespace perpcore::tests

// Test suite entry point. Cases live in the *_test.cpp files next to this one.
#include "framework.hpp"

#include <iostream>

// engine_test.cpp
void test_engine_roundtrip_typed_values();
void test_engine_open_existing_requires_file();
void test_engine_rejects_trailing_statements();
void test_transaction_rolls_back_on_scope_exit();
void test_engine_close_is_idempotent();
void test_quote_identifier();

// store_test.cpp
void test_close_never_opened_is_not_open();
void test_create_then_resolve_version();
void test_open_twice_is_already_open();
void test_close_resets_version_and_path();
void test_open_missing_file_is_not_found();
void test_open_non_store_file_is_engine_error();
void test_open_database_without_history_is_engine_error();
void test_open_without_version_entry_fails();
void test_create_while_open_is_already_open();
void test_create_over_existing_declined_keeps_file();
void test_create_over_existing_accepted_replaces_file();
void test_create_force_skips_gate();
void test_create_per_call_gate_overrides_store_gate();
void test_create_makes_parent_directories();
void test_history_survives_reopen();
void test_verbosity_setting();
void test_declined_create_traced_at_default_verbosity();
void test_quiet_verbosity_hides_progress();

// history_test.cpp
void test_later_version_wins();
void test_same_instant_resolves_to_later_insert();
void test_timestamp_outranks_insertion_order();
void test_entries_carry_clock_time_and_kind();
void test_payload_is_stored_verbatim();
void test_resolve_without_version_entry();
void test_parse_history_kind();
void test_history_requires_open_store();

// table_test.cpp
void test_add_table_creates_and_records();
void test_replace_denied_keeps_rows();
void test_replace_accepted_recreates_empty();
void test_add_drop_add_yields_empty_table();
void test_engine_failure_rolls_back_replace();
void test_engine_error_message_names_table();
void test_column_text_cannot_smuggle_statements();
void test_odd_table_names_are_quoted();
void test_reserved_names_rejected();
void test_drop_table_gate();
void test_drop_missing_table_is_noop();
void test_list_tables_excludes_history();
void test_tables_require_open_store();

// gate_test.cpp
void test_prompt_accepts_yes();
void test_prompt_declines_on_no_any_case();
void test_prompt_loops_until_valid_choice();
void test_prompt_declines_at_end_of_input();
void test_fixed_policies();
void test_scripted_answers_then_decline();

// config_test.cpp
void test_config_defaults();
void test_config_json_overlay();
void test_config_rejects_bad_values();
void test_config_file_then_environment();
void test_config_env_points_at_file();
void test_config_bad_environment_value();
void test_config_missing_file();
void test_config_quiet_verbosity_and_gate_names();

int main()
{
  std::cout << "\033[36mRunning vts test suite...\033[0m" << std::endl;

  // --- storage engine adapter ---
  RUN_TEST(test_engine_roundtrip_typed_values);
  RUN_TEST(test_engine_open_existing_requires_file);
  RUN_TEST(test_engine_rejects_trailing_statements);
  RUN_TEST(test_transaction_rolls_back_on_scope_exit);
  RUN_TEST(test_engine_close_is_idempotent);
  RUN_TEST(test_quote_identifier);

  // --- store lifecycle ---
  RUN_TEST(test_close_never_opened_is_not_open);
  RUN_TEST(test_create_then_resolve_version);
  RUN_TEST(test_open_twice_is_already_open);
  RUN_TEST(test_close_resets_version_and_path);
  RUN_TEST(test_open_missing_file_is_not_found);
  RUN_TEST(test_open_non_store_file_is_engine_error);
  RUN_TEST(test_open_database_without_history_is_engine_error);
  RUN_TEST(test_open_without_version_entry_fails);
  RUN_TEST(test_create_while_open_is_already_open);
  RUN_TEST(test_create_over_existing_declined_keeps_file);
  RUN_TEST(test_create_over_existing_accepted_replaces_file);
  RUN_TEST(test_create_force_skips_gate);
  RUN_TEST(test_create_per_call_gate_overrides_store_gate);
  RUN_TEST(test_create_makes_parent_directories);
  RUN_TEST(test_history_survives_reopen);
  RUN_TEST(test_verbosity_setting);
  RUN_TEST(test_declined_create_traced_at_default_verbosity);
  RUN_TEST(test_quiet_verbosity_hides_progress);

  // --- history log ---
  RUN_TEST(test_later_version_wins);
  RUN_TEST(test_same_instant_resolves_to_later_insert);
  RUN_TEST(test_timestamp_outranks_insertion_order);
  RUN_TEST(test_entries_carry_clock_time_and_kind);
  RUN_TEST(test_payload_is_stored_verbatim);
  RUN_TEST(test_resolve_without_version_entry);
  RUN_TEST(test_parse_history_kind);
  RUN_TEST(test_history_requires_open_store);

  // --- tables ---
  RUN_TEST(test_add_table_creates_and_records);
  RUN_TEST(test_replace_denied_keeps_rows);
  RUN_TEST(test_replace_accepted_recreates_empty);
  RUN_TEST(test_add_drop_add_yields_empty_table);
  RUN_TEST(test_engine_failure_rolls_back_replace);
  RUN_TEST(test_engine_error_message_names_table);
  RUN_TEST(test_column_text_cannot_smuggle_statements);
  RUN_TEST(test_odd_table_names_are_quoted);
  RUN_TEST(test_reserved_names_rejected);
  RUN_TEST(test_drop_table_gate);
  RUN_TEST(test_drop_missing_table_is_noop);
  RUN_TEST(test_list_tables_excludes_history);
  RUN_TEST(test_tables_require_open_store);

  // --- confirmation gate ---
  RUN_TEST(test_prompt_accepts_yes);
  RUN_TEST(test_prompt_declines_on_no_any_case);
  RUN_TEST(test_prompt_loops_until_valid_choice);
  RUN_TEST(test_prompt_declines_at_end_of_input);
  RUN_TEST(test_fixed_policies);
  RUN_TEST(test_scripted_answers_then_decline);

  // --- configuration ---
  RUN_TEST(test_config_defaults);
  RUN_TEST(test_config_json_overlay);
  RUN_TEST(test_config_rejects_bad_values);
  RUN_TEST(test_config_file_then_environment);
  RUN_TEST(test_config_env_points_at_file);
  RUN_TEST(test_config_bad_environment_value);
  RUN_TEST(test_config_missing_file);
  RUN_TEST(test_config_quiet_verbosity_and_gate_names);

  vts::test::print_summary();
  return (vts::test::failed_count == 0) ? 0 : 1;
}

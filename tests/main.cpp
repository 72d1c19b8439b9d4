#include <iostream>

void run_preprocess_tests();
void run_lexer_tests();
void run_parser_tests();
void run_type_tests();
void run_scope_tests();
void run_type_checker_tests();
void run_lower_tests();
void run_ir_emitter_tests();
void run_diagnostics_tests();
void run_env_tests();

int main(){
    run_preprocess_tests();
    run_lexer_tests();
    run_parser_tests();
    run_type_tests();
    run_scope_tests();
    run_type_checker_tests();
    run_lower_tests();
    run_ir_emitter_tests();
    run_diagnostics_tests();
    run_env_tests();
    std::cout << "All tests passed\n";
    return 0;
}

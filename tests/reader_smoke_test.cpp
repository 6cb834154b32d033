#include <cassert>
#include <string>
#include <tao/pegtl.hpp>
#include "alkey/reader.hpp"

namespace pegtl = tao::pegtl;

// Minimal grammar: the PEGTL install itself works
struct alkey_word : pegtl::string<'a','l','k','e','y'> {};
struct grammar : pegtl::must< alkey_word, pegtl::eof > {};

void run_reader_smoke_test(){
    {
        pegtl::memory_input in("alkey", "pegtl-smoke");
        const bool ok = pegtl::parse< grammar >(in);
        assert(ok && "PEGTL should parse 'alkey'");
        (void)ok;
    }
    {
        pegtl::memory_input in("alkey!", "pegtl-smoke-bad");
        bool threw = false;
        try {
            (void)pegtl::parse< grammar >(in);
        } catch (const pegtl::parse_error&) {
            threw = true; // expected: not EOF
        }
        assert(threw && "PEGTL should reject trailing characters");
        (void)threw;
    }
    {
        auto forms = alkey::read_forms("(product :name P :fields [])", "smoke");
        assert(forms.size() == 1 && forms[0]->kind == alkey::form::Kind::List);
        (void)forms;
    }
}

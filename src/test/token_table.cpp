#include "currency/currency_id.hpp"
#include "general/errors.hpp"
#include <cassert>
#include <iostream>
using namespace std;

void test_lookup()
{
    assert(token_id(TokenSymbol::ACA) == 0);
    assert(token_id(TokenSymbol::AUSD) == 1);
    assert(token_id(TokenSymbol::LKSM) == 13);
    assert(token_decimals(TokenSymbol::ACA) == 12);
    assert(token_decimals(TokenSymbol::DOT) == 10);
    assert(token_decimals(TokenSymbol::XBTC) == 8);
    assert(token_name(TokenSymbol::AUSD) == "Acala Dollar");
    assert(token_symbol_str(TokenSymbol::KSM) == "KSM");
}

void test_reverse_lookup()
{
    for (auto& t : all_tokens()) {
        assert(token_from_id(t.id()) == t.symbol);
        assert(token_from_string(t.symbolStr) == t.symbol);
    }
    assert(!token_from_id(uint32_t(all_tokens().size())));
    assert(!token_from_id(RESERVED_OFFSET));
    assert(!token_from_id(0xFFFFFFFF));
    assert(!token_from_string("aca"));
    assert(!token_from_string(""));
}

void test_currency_strings()
{
    auto a { EvmAddress::parse("0x00000000000000000000000000000000000000AB").value() };
    assert(a.to_string() == "0x00000000000000000000000000000000000000ab");
    assert(!EvmAddress::parse("0x1234"));
    assert(!EvmAddress::parse("zz000000000000000000000000000000000000ab"));
    assert(EvmAddress("00000000000000000000000000000000000000ab") == a);
    bool thrown { false };
    try {
        EvmAddress("0xab");
    } catch (const Error& e) {
        thrown = e.code == EBADADDRESS;
    }
    assert(thrown);
    CurrencyId token { TokenSymbol::DOT };
    CurrencyId contract { a };
    CurrencyId pair { DexShare { TokenSymbol::ACA, a } };
    assert(token.is_token() && contract.is_erc20() && pair.is_dex_share());
    assert(token.to_string() == "DOT");
    assert(contract.to_string() == a.to_string());
    assert(pair.to_string() == "DexShare(ACA, " + a.to_string() + ")");
    assert(CurrencyId(DexShareLeg(TokenSymbol::DOT)) == token);
    assert(CurrencyId(DexShareLeg(a)) == contract);
    assert(!(token == contract));
}

int main()
{
    test_lookup();
    test_reverse_lookup();
    test_currency_strings();
    cout << "token table tests passed" << endl;
}

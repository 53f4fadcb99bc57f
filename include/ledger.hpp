#pragma once

#include "types.hpp"

#include <map>
#include <set>

namespace rv {

// Native-currency balances of the execution environment. Every mutation is all-or-nothing.
class Ledger {
public:
    Wei balanceOf(const Address& account) const;

    // Overwrites the balance of an account (faucet for tests and local simulations).
    void deal(const Address& account, const Wei& amount);

    void transfer(const Address& from, const Address& to, const Wei& amount);

    void setRejectsPayments(const Address& account, bool rejects);
    bool rejectsPayments(const Address& account) const;

    Wei totalSupply() const;

private:
    std::map<Address, Wei> balances_;
    std::set<Address> rejecting_;
};

} // namespace rv

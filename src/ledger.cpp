#include "ledger.hpp"

#include "errors.hpp"
#include "units.hpp"

namespace rv {

Wei Ledger::balanceOf(const Address& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

void Ledger::deal(const Address& account, const Wei& amount) {
    if (amount == 0) {
        balances_.erase(account);
        return;
    }
    balances_[account] = amount;
}

void Ledger::transfer(const Address& from, const Address& to, const Wei& amount) {
    if (rejecting_.count(to) != 0) {
        throw TransferError(TransferError::Reason::Rejected, to + " does not accept payments");
    }
    Wei available = balanceOf(from);
    if (available < amount) {
        throw TransferError(TransferError::Reason::InsufficientFunds,
                            from + " holds " + formatEther(available) + " ETH, needs " +
                                formatEther(amount) + " ETH");
    }
    if (amount == 0 || from == to) {
        return;
    }

    deal(from, available - amount);
    deal(to, balanceOf(to) + amount);
}

void Ledger::setRejectsPayments(const Address& account, bool rejects) {
    if (rejects) {
        rejecting_.insert(account);
    } else {
        rejecting_.erase(account);
    }
}

bool Ledger::rejectsPayments(const Address& account) const {
    return rejecting_.count(account) != 0;
}

Wei Ledger::totalSupply() const {
    Wei total = 0;
    for (const auto& [account, balance] : balances_) {
        (void)account;
        total += balance;
    }
    return total;
}

} // namespace rv

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

using boost::multiprecision::cpp_int;
using Decimal = boost::multiprecision::cpp_dec_float_50;

// Number of words in [0, 2^256) that select ticket `index` out of `tickets` under word mod n.
cpp_int wordsSelecting(std::uint64_t index, std::uint64_t tickets, const cpp_int& range) {
    cpp_int base = range / tickets;
    cpp_int remainder = range % tickets;
    return (cpp_int(index) < remainder) ? base + 1 : base;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: analyze_odds <ticketsPlayer0> [ticketsPlayer1 ...]\n";
        return 1;
    }

    std::vector<std::uint64_t> ticketsPerPlayer;
    std::uint64_t totalTickets = 0;
    for (int i = 1; i < argc; ++i) {
        try {
            std::uint64_t tickets = std::stoull(argv[i]);
            ticketsPerPlayer.push_back(tickets);
            totalTickets += tickets;
        } catch (const std::exception& ex) {
            std::cerr << "Ticket counts must be unsigned integers: " << ex.what() << '\n';
            return 1;
        }
    }
    if (totalTickets == 0) {
        std::cerr << "At least one ticket is required\n";
        return 1;
    }

    const cpp_int range = cpp_int(1) << 256;
    const Decimal rangeDec(range);

    std::cout << "=== WIN PROBABILITY (word mod " << totalTickets << ") ===\n";
    std::uint64_t ticket = 0;
    for (std::size_t player = 0; player < ticketsPerPlayer.size(); ++player) {
        cpp_int favourable = 0;
        for (std::uint64_t t = 0; t < ticketsPerPlayer[player]; ++t, ++ticket) {
            favourable += wordsSelecting(ticket, totalTickets, range);
        }
        Decimal exact = Decimal(favourable) / rangeDec;
        Decimal fair = Decimal(ticketsPerPlayer[player]) / Decimal(totalTickets);
        std::cout << "  player " << player << " (" << ticketsPerPlayer[player] << " tickets): "
                  << std::setprecision(12) << exact << "  fair " << fair << '\n';
    }

    cpp_int remainder = range % totalTickets;
    cpp_int wordsPerTicket = range / totalTickets;
    Decimal bias = (remainder == 0) ? Decimal(0) : Decimal(1) / Decimal(wordsPerTicket);
    std::cout << "\n=== MODULO BIAS ===\n";
    std::cout << "Tickets favoured by one extra word: " << remainder << '\n';
    std::cout << "Relative advantage of a favoured ticket: " << std::setprecision(6)
              << std::scientific << bias << '\n';
    return 0;
}

//
// Created by Revhome on 15.10.2026.
//

#include "ConsoleActions.hpp"
#include <stdexcept>

ConsoleActions::ConsoleActions(std::ostream &out) : out(out) {}

void ConsoleActions::sendToRepeater(const OutboundRequest &request, const std::string &label) {
    out << "### " << label << (request.secure ? " (https)" : " (http)") << "\n" << request.raw;
    if (!out) throw std::runtime_error("output stream is not writable");
}

void ConsoleActions::sendToOrganizer(const OutboundRequest &request) {
    out << "### organizer " << request.url << "\n" << request.raw;
    if (!out) throw std::runtime_error("output stream is not writable");
}

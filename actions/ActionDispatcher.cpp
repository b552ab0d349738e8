//
// Created by Revhome on 15.10.2026.
//

#include "ActionDispatcher.hpp"
#include "RequestBuilder.hpp"
#include <iostream>

ActionDispatcher::ActionDispatcher(ToolActions &tools) : tools(tools) {}

std::string ActionDispatcher::labelFor(const std::string &url) {
    return "URLSucker-" + url;
}

bool ActionDispatcher::sendToRepeater(const SnapshotRow &row) {
    const std::string url = rowUrl(row);
    const auto request = buildGetRequest(url);
    if (!request) {
        std::cerr << "Repeater: cannot build request for " << url << "\n";
        return false;
    }
    try {
        tools.sendToRepeater(*request, labelFor(url));
    } catch (const std::exception &e) {
        std::cerr << "Repeater: " << url << ": " << e.what() << "\n";
        return false;
    } catch (...) {
        std::cerr << "Repeater: " << url << ": unknown error\n";
        return false;
    }
    std::cerr << "Sent to Repeater: " << url << "\n";
    return true;
}

bool ActionDispatcher::sendToOrganizer(const SnapshotRow &row) {
    const std::string url = rowUrl(row);
    const auto request = buildGetRequest(url);
    if (!request) {
        std::cerr << "Organizer: cannot build request for " << url << "\n";
        return false;
    }
    try {
        tools.sendToOrganizer(*request);
    } catch (const std::exception &e) {
        std::cerr << "Organizer: " << url << ": " << e.what() << "\n";
        return false;
    } catch (...) {
        std::cerr << "Organizer: " << url << ": unknown error\n";
        return false;
    }
    std::cerr << "Sent to Organizer: " << url << "\n";
    return true;
}

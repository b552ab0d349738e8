//
// Created by Revhome on 15.10.2026.
//

#ifndef URL_SUCKER_APP_CONSOLE_ACTIONS_HPP
#define URL_SUCKER_APP_CONSOLE_ACTIONS_HPP

#include <ostream>
#include "ToolActions.hpp"

// 🖨 Инструменты для командной строки: запросы печатаются в поток
class ConsoleActions : public ToolActions {
public:
    explicit ConsoleActions(std::ostream &out);

    void sendToRepeater(const OutboundRequest &request, const std::string &label) override;
    void sendToOrganizer(const OutboundRequest &request) override;

private:
    std::ostream &out;
};

#endif //URL_SUCKER_APP_CONSOLE_ACTIONS_HPP

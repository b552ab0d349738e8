//
// Created by Revhome on 15.10.2026.
//

#ifndef URL_SUCKER_APP_ACTION_DISPATCHER_HPP
#define URL_SUCKER_APP_ACTION_DISPATCHER_HPP

#include <string>
#include "ToolActions.hpp"
#include "../include/DiscoveredUrl.hpp"

// 🎯 Отправка выбранной строки во внешние инструменты.
// Ошибки (плохой URL, исключение инструмента) пишутся в лог, наружу не выходят.
class ActionDispatcher {
public:
    explicit ActionDispatcher(ToolActions &tools);

    bool sendToRepeater(const SnapshotRow &row);
    bool sendToOrganizer(const SnapshotRow &row);

    static std::string labelFor(const std::string &url);

private:
    ToolActions &tools;
};

#endif //URL_SUCKER_APP_ACTION_DISPATCHER_HPP

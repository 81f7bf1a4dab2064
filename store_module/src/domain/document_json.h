#pragma once

#include <nlohmann/json.hpp>

#include "entities.h"

// Сериализация документа в формат data.json.
// from_json терпим к отсутствующим полям: всё недостающее заполняется значениями по умолчанию

void to_json(nlohmann::json& j, const Profile& p);
void from_json(const nlohmann::json& j, Profile& p);

void to_json(nlohmann::json& j, const Chat& c);
void from_json(const nlohmann::json& j, Chat& c);

void to_json(nlohmann::json& j, const ChatMessage& m);
void from_json(const nlohmann::json& j, ChatMessage& m);

void to_json(nlohmann::json& j, const Order& o);
void from_json(const nlohmann::json& j, Order& o);

void to_json(nlohmann::json& j, const Comment& c);
void from_json(const nlohmann::json& j, Comment& c);

void to_json(nlohmann::json& j, const Promocode& p);
void from_json(const nlohmann::json& j, Promocode& p);

void to_json(nlohmann::json& j, const VipProfile& p);
void from_json(const nlohmann::json& j, VipProfile& p);

void to_json(nlohmann::json& j, const Banner& b);
void from_json(const nlohmann::json& j, Banner& b);

void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);

void to_json(nlohmann::json& j, const IdCounters& c);
void from_json(const nlohmann::json& j, IdCounters& c);

void to_json(nlohmann::json& j, const Document& d);
void from_json(const nlohmann::json& j, Document& d);

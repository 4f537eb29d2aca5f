// to_value_demo.cpp
// Converting application types into MessagePack-model Value trees
//
// Shows:
// - standard containers, optionals and variants
// - a user struct and an enum-like type describing themselves
// - a timestamp carried as a MessagePack Ext through the sentinel newtype
// - error reporting for a malformed Ext

#include <mpvalue/to_value.h>

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

using namespace mpvalue;

// ============================================================
// Application types
// ============================================================

// MessagePack timestamp 32: ext type -1, 4-byte big-endian seconds
struct Timestamp
{
    uint32_t seconds;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const
    {
        const ByteBuffer payload{
            static_cast<uint8_t>(seconds >> 24), static_cast<uint8_t>(seconds >> 16),
            static_cast<uint8_t>(seconds >> 8), static_cast<uint8_t>(seconds)};
        return s.serialize_newtype_struct(ext_struct_name, std::make_tuple(int8_t{-1}, Bytes{payload}));
    }
};

struct Player
{
    std::string name;
    uint8_t level;
    std::optional<std::string> guild;
    Timestamp joined;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const
    {
        auto st = s.serialize_struct("Player", 4);
        st.serialize_field("name", name);
        st.serialize_field("level", level);
        st.serialize_field("guild", guild);
        st.serialize_field("joined", joined);
        return st.end();
    }
};

// enum Event { Login, Move(f32, f32), Chat { text: String } }
struct Event
{
    enum class Kind { Login, Move, Chat };

    Kind kind = Kind::Login;
    float x = 0.0f;
    float y = 0.0f;
    std::string text;

    template <Serializer S>
    typename S::ok_type serialize(S& s) const
    {
        switch (kind) {
        case Kind::Move: {
            auto tv = s.serialize_tuple_variant("Event", 1, "Move", 2);
            tv.serialize_field(x);
            tv.serialize_field(y);
            return tv.end();
        }
        case Kind::Chat: {
            auto sv = s.serialize_struct_variant("Event", 2, "Chat", 1);
            sv.serialize_field("text", text);
            return sv.end();
        }
        case Kind::Login:
            break;
        }
        return s.serialize_unit_variant("Event", 0, "Login");
    }
};

// Ext payload missing its type tag
struct BrokenExt
{
    template <Serializer S>
    typename S::ok_type serialize(S& s) const
    {
        const ByteBuffer payload{0, 0, 0, 1};
        return s.serialize_newtype_struct(ext_struct_name, std::make_tuple(Bytes{payload}));
    }
};

int main()
{
    std::cout << "=== mpvalue to_value demo ===\n\n";

    // -------------------------------------------------------
    // Standard library types
    // -------------------------------------------------------
    std::cout << "--- Standard types ---\n";

    std::map<std::string, std::vector<int>> scores{{"alice", {90, 85}}, {"bob", {70}}};
    std::cout << "map:     " << value_to_string(to_value(scores)) << "\n";

    std::tuple<int, double, std::string> record{-1, 0.5, "row"};
    std::cout << "tuple:   " << value_to_string(to_value(record)) << "\n";

    std::variant<std::monostate, int, std::string> choice{std::string{"picked"}};
    std::cout << "variant: " << value_to_string(to_value(choice)) << "\n";

    // -------------------------------------------------------
    // User types
    // -------------------------------------------------------
    std::cout << "\n--- User types ---\n";

    Player player{"kestrel", 12, std::nullopt, Timestamp{1700000000}};
    Value tree = to_value(player);
    std::cout << "player:  " << value_to_string(tree) << "\n";

    Value joined = tree.at(3);
    if (auto* ext = joined.get_if<Ext>()) {
        std::cout << "joined is ext type " << static_cast<int>(ext->type)
                  << " with " << ext->data.size() << " bytes\n";
    }

    std::vector<Event> events{
        Event{},
        Event{Event::Kind::Move, 1.5f, -2.0f, {}},
        Event{Event::Kind::Chat, 0.0f, 0.0f, "gg"},
    };
    std::cout << "events:  " << value_to_string(to_value(events)) << "\n";

    // -------------------------------------------------------
    // Round trip through the Value passthrough
    // -------------------------------------------------------
    std::cout << "\n--- Passthrough ---\n";
    std::cout << "to_value(tree) == tree: " << std::boolalpha << (to_value(tree) == tree) << "\n";

    // -------------------------------------------------------
    // Errors
    // -------------------------------------------------------
    std::cout << "\n--- Errors ---\n";
    try {
        (void)to_value(BrokenExt{});
    } catch (const Error& e) {
        std::cout << "BrokenExt: " << e.what() << "\n";
    }

    try {
        (void)to_value(char32_t{0xDFFF});
    } catch (const Error& e) {
        std::cout << "lone surrogate: " << e.what() << "\n";
    }

    return 0;
}

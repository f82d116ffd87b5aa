#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <dao/naming.h>
#include "meow_flat_map.h"

namespace dao {

// Trie keyed by the label sequence of an Address.
template <typename T>
class PrefixTrie {
    struct Node {
        std::optional<T> value;
        meow::flat_map<Label, std::unique_ptr<Node>> children;

        [[nodiscard]] bool is_empty() const noexcept { return !value && children.empty(); }
    };

public:
    PrefixTrie() = default;
    PrefixTrie(const PrefixTrie&) = delete;
    PrefixTrie(PrefixTrie&&) noexcept = default;
    PrefixTrie& operator=(const PrefixTrie&) = delete;
    PrefixTrie& operator=(PrefixTrie&&) noexcept = default;

    // --- Lookup ---

    [[nodiscard]] T* find(const Address& address) noexcept {
        Node* node = walk(address);
        return (node && node->value) ? &*node->value : nullptr;
    }

    [[nodiscard]] const T* find(const Address& address) const noexcept {
        const Node* node = walk(address);
        return (node && node->value) ? &*node->value : nullptr;
    }

    [[nodiscard]] bool contains(const Address& address) const noexcept { return find(address) != nullptr; }

    [[nodiscard]] bool empty() const noexcept { return root_.is_empty(); }

    // --- Mutation ---

    // Returns false and leaves the trie untouched when the address is taken.
    bool insert(const Address& address, T value) {
        Node& node = make_path(address);
        if (node.value) return false;
        node.value.emplace(std::move(value));
        return true;
    }

    void insert_or_assign(const Address& address, T value) {
        make_path(address).value = std::move(value);
    }

    bool erase(const Address& address) {
        return erase_in(root_, address.labels(), 0, false);
    }

    // Drops the node at the address together with everything below it.
    bool erase_branch(const Address& address) {
        return erase_in(root_, address.labels(), 0, true);
    }

    void clear() noexcept { root_ = Node{}; }

    // --- Traversal (label order, parents before children) ---

    template <typename Fn>
    void for_each(Fn&& fn) const {
        std::vector<Label> path;
        visit(root_, path, fn);
    }

    template <typename Fn>
    void for_each_under(const Address& prefix, Fn&& fn) const {
        const Node* node = walk(prefix);
        if (!node) return;
        std::vector<Label> path = prefix.labels();
        visit(*node, path, fn);
    }

    [[nodiscard]] std::vector<Address> addresses() const {
        std::vector<Address> out;
        for_each([&out](const Address& address, const T&) { out.push_back(address); });
        return out;
    }

private:
    Node root_;

    template <typename Self>
    auto walk(this Self&& self, const Address& address) noexcept {
        auto* node = &self.root_;
        for (const Label& label : address.labels()) {
            auto* next = node->children.find(label);
            if (!next) return static_cast<decltype(node)>(nullptr);
            node = next->get();
        }
        return node;
    }

    Node& make_path(const Address& address) {
        Node* node = &root_;
        for (const Label& label : address.labels()) {
            auto [slot, inserted] = node->children.try_emplace(label);
            if (inserted) *slot = std::make_unique<Node>();
            node = slot->get();
        }
        return *node;
    }

    static bool erase_in(Node& node, const std::vector<Label>& labels, size_t depth, bool branch) {
        auto* slot = node.children.find(labels[depth]);
        if (!slot) return false;
        Node& child = **slot;

        bool removed = false;
        if (depth + 1 == labels.size()) {
            if (branch) {
                node.children.erase(labels[depth]);
                return true;
            }
            removed = child.value.has_value();
            child.value.reset();
        } else {
            removed = erase_in(child, labels, depth + 1, branch);
        }

        if (child.is_empty()) node.children.erase(labels[depth]);
        return removed;
    }

    template <typename Fn>
    static void visit(const Node& node, std::vector<Label>& path, Fn& fn) {
        if (node.value && !path.empty()) fn(Address(path), *node.value);
        const auto& keys = node.children.keys();
        const auto& kids = node.children.values();
        for (size_t i = 0; i < keys.size(); ++i) {
            path.push_back(keys[i]);
            visit(*kids[i], path, fn);
            path.pop_back();
        }
    }
};

}

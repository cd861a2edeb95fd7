#ifndef TICKBOOK_JOURNAL_HPP
#define TICKBOOK_JOURNAL_HPP

#include <cstddef>
#include <utility>
#include <vector>

namespace tickbook {

// =============================================================================
// Revertible State
// =============================================================================

// A store whose state can be saved and restored as a unit. Checkpoints nest:
// every checkpoint() is matched by exactly one rollback() or commit().
class Revertible {
public:
    virtual ~Revertible() = default;

    virtual void checkpoint() = 0;
    virtual void rollback() = 0;
    virtual void commit() = 0;
};

// =============================================================================
// Journal - the set of stores that commit or roll back together
// =============================================================================

class Journal {
public:
    Journal() = default;

    // Non-copyable
    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    // Stores may only join or leave while no transaction is open
    void attach(Revertible* store);
    void detach(Revertible* store);

    void begin();
    void commit();
    void rollback();

    size_t depth() const { return depth_; }
    size_t size() const { return stores_.size(); }

private:
    std::vector<Revertible*> stores_;
    size_t depth_{0};
};

// RAII scope over a Journal: rolls back unless commit() was reached
class Transaction {
public:
    explicit Transaction(Journal& journal);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Journal& journal_;
    bool done_{false};
};

// =============================================================================
// Versioned<State> - Revertible store holding its state as one value
// =============================================================================

template <typename State>
class Versioned : public Revertible {
public:
    explicit Versioned(Journal& journal) : journal_(journal) {
        journal_.attach(this);
    }

    ~Versioned() override {
        journal_.detach(this);
    }

    Versioned(const Versioned&) = delete;
    Versioned& operator=(const Versioned&) = delete;

    void checkpoint() override { saved_.push_back(state_); }

    void rollback() override {
        state_ = std::move(saved_.back());
        saved_.pop_back();
    }

    void commit() override { saved_.pop_back(); }

protected:
    Journal& journal() { return journal_; }

    State state_{};

private:
    Journal& journal_;
    std::vector<State> saved_;
};

} // namespace tickbook

#endif // TICKBOOK_JOURNAL_HPP

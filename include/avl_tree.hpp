// avl_tree.hpp
// Thread-safe AVL tree (single reader/writer lock).
// -----------------------------------------------------------
// * Readers (lookup / range / traversal / statistics) share one
//   std::shared_mutex in shared mode and run fully in parallel.
// * Writers (insert / erase / clear) take the same mutex exclusively and
//   hold it for the whole structural change, rebalancing included, so no
//   reader can ever observe a half-rotated subtree.
// * Every node owns its children through std::unique_ptr; rotations move
//   ownership between nodes, they never copy or leak a subtree.  There are
//   no parent pointers: mutation is recursive top-down, traversal uses an
//   explicit stack.
//
//   Build:  part of the taskavl CMake project (header-only).

#ifndef TAVL_AVL_TREE_HPP
#define TAVL_AVL_TREE_HPP

#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include "print.hpp"

namespace tavl
{

    /*-------------------------------------------------------------------------
     *  struct TreeOptions
     *-------------------------------------------------------------------------
     *  verify_each_mutation – re-run the full self-check after every insert,
     *                         erase and batch while the exclusive lock is still
     *                         held.  A failed check is logged and the process
     *                         aborts: a corrupted index has no bounded-time
     *                         recovery.  O(n) per mutation, debugging only.
     *-------------------------------------------------------------------------*/
    struct TreeOptions
    {
        bool verify_each_mutation{false};

        /* Defaults, with TAVL_VERIFY=1 switching verification on. */
        static TreeOptions from_env()
        {
            TreeOptions opts;
            const char *env = std::getenv("TAVL_VERIFY");
            opts.verify_each_mutation = env && env[0] == '1';
            return opts;
        }
    };

    /*-------------------------------------------------------------------------
     *  struct Statistics<K>
     *-------------------------------------------------------------------------
     *  Diagnostic snapshot.  node_count, height and balanced are derived by
     *  walking the tree, not read from the cached per-node heights, so they
     *  double as an independent check of the bookkeeping.
     *-------------------------------------------------------------------------*/
    template <typename K>
    struct Statistics
    {
        std::size_t node_count{0};
        int height{0};
        bool balanced{true};
        std::optional<K> min_key;
        std::optional<K> max_key;
    };

    /*-------------------------------------------------------------------------
     *  struct AVLNode<K,V>
     *-------------------------------------------------------------------------
     *  key     – ordering key; compared only through the tree's Compare.
     *  val     – payload, overwritten in place on duplicate insert.
     *  height  – height of the subtree rooted here (leaf = 1, empty = 0).
     *  left,right – exclusively owned children.
     *-------------------------------------------------------------------------*/
    template <typename K, typename V>
    struct AVLNode
    {
        K key;
        V val;
        int height{1};

        std::unique_ptr<AVLNode> left;
        std::unique_ptr<AVLNode> right;

        AVLNode(const K &k, V v) : key(k), val(std::move(v)) {}
    };

    template <typename K, typename V, typename Compare = std::less<K>>
    class AVLTree
    {
    public:
        using NodeT = AVLNode<K, V>;
        using NodePtr = std::unique_ptr<NodeT>;

        explicit AVLTree(TreeOptions opts = {}) : options(opts) {}

        /* Nodes are released by unique_ptr, depth is bounded by the height. */
        ~AVLTree() = default;

        AVLTree(const AVLTree &) = delete;
        AVLTree &operator=(const AVLTree &) = delete;

        // ────────────────────────────────────────────────────────────────────────
        //  INSERT
        //
        //  • Plain BST descent, the new node is attached as a leaf.
        //  • Equal key: the payload is replaced in place.  Node identity and the
        //    shape of the tree are untouched, no rotation happens.
        //  • On the way back up each ancestor refreshes its height and, when
        //    |balance| reaches 2, one of the four cases is applied.  The case is
        //    picked from where the new key went relative to the child on the
        //    heavy side (LL / LR / RR / RL).
        //
        //  Returns true when a node was created, false on overwrite.
        // ────────────────────────────────────────────────────────────────────────
        bool insert(const K &k, V v)
        {
            std::unique_lock<std::shared_mutex> write_lock(rw);

            bool created = insert_rec(root, k, std::move(v));
            if (created)
                ++count;
            verify_locked("insert");
            return created;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  Batch insert of (key, value) pairs under a single critical section.
        //  Readers see either none or all of the batch.  Returns the number of
        //  newly created nodes; later duplicates in the batch win.
        // ────────────────────────────────────────────────────────────────────────
        template <typename InputIt>
        std::size_t insert_batch(InputIt first, InputIt last)
        {
            std::unique_lock<std::shared_mutex> write_lock(rw);

            std::size_t created = 0;
            for (; first != last; ++first)
            {
                if (insert_rec(root, first->first, first->second))
                    ++created;
            }
            count += created;
            verify_locked("insert_batch");
            return created;
        }

        // Read-only lookup, std::nullopt when absent.
        std::optional<V> lookup(const K &k) const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);

            const NodeT *n = find_node(k);
            if (!n)
                return std::nullopt;
            return n->val;
        }

        bool contains(const K &k) const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);
            return find_node(k) != nullptr;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  ERASE
        //
        //  • 0 or 1 child: the node is spliced out, its child (possibly empty)
        //    takes its slot.
        //  • 2 children: the in-order successor's key and payload move into the
        //    node and the successor is erased from the right subtree instead.
        //  • Every ancestor on the path is rebalanced from the balance factors of
        //    its current children; the deleted key says nothing about which
        //    side became heavy.
        //
        //  Returns false if the key was not present.
        // ────────────────────────────────────────────────────────────────────────
        bool erase(const K &k)
        {
            std::unique_lock<std::shared_mutex> write_lock(rw);

            bool removed = erase_rec(root, k);
            if (removed)
                --count;
            verify_locked("erase");
            return removed;
        }

        /* Drops the whole hierarchy in one exclusive section. */
        void clear()
        {
            std::unique_lock<std::shared_mutex> write_lock(rw);
            NodePtr doomed = std::move(root);
            count = 0;
            write_lock.unlock();
            // doomed released here; nothing else can reach it any more
        }

        std::optional<V> min_value() const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);
            if (!root)
                return std::nullopt;
            const NodeT *n = root.get();
            while (n->left)
                n = n->left.get();
            return n->val;
        }

        std::optional<V> max_value() const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);
            if (!root)
                return std::nullopt;
            const NodeT *n = root.get();
            while (n->right)
                n = n->right.get();
            return n->val;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  RANGE  [lo, hi]  (inclusive)
        //
        //  Pruned in-order walk: a node's left subtree is entered only when
        //  lo < key, its right subtree only when key < hi.  Results come out in
        //  ascending key order.  hi < lo is rejected before the lock is taken.
        // ────────────────────────────────────────────────────────────────────────
        std::vector<V> range(const K &lo, const K &hi) const
        {
            if (comp(hi, lo))
                throw std::invalid_argument("range: lower bound is greater than upper bound");

            std::shared_lock<std::shared_mutex> read_lock(rw);

            std::vector<V> out;
            std::vector<const NodeT *> stack;
            const NodeT *cur = root.get();

            while (cur || !stack.empty())
            {
                while (cur)
                {
                    stack.push_back(cur);
                    cur = comp(lo, cur->key) ? cur->left.get() : nullptr;
                }

                cur = stack.back();
                stack.pop_back();

                if (!comp(cur->key, lo) && !comp(hi, cur->key))
                    out.push_back(cur->val);

                cur = comp(cur->key, hi) ? cur->right.get() : nullptr;
            }
            return out;
        }

        std::vector<V> in_order() const
        {
            std::vector<V> out;
            for_each([&out](const K &, const V &v) { out.push_back(v); });
            return out;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  Ascending visit of every (key, value) pair under the shared lock.
        //  Uses an explicit stack so the walk never depends on call-stack depth.
        //  fn must not call back into this tree.
        // ────────────────────────────────────────────────────────────────────────
        template <typename Fn>
        void for_each(Fn &&fn) const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);

            std::vector<const NodeT *> stack;
            stack.reserve(static_cast<std::size_t>(height_of(root.get())));
            const NodeT *cur = root.get();

            while (cur || !stack.empty())
            {
                while (cur)
                {
                    stack.push_back(cur);
                    cur = cur->left.get();
                }
                cur = stack.back();
                stack.pop_back();
                fn(cur->key, cur->val);
                cur = cur->right.get();
            }
        }

        std::size_t size() const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);
            return count;
        }

        bool empty() const { return size() == 0; }

        /* Cached height of the root (0 for an empty tree). */
        int height() const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);
            return height_of(root.get());
        }

        Statistics<K> statistics() const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);

            Statistics<K> stats;
            stats.height = derive_rec(root.get(), stats.node_count, stats.balanced);
            if (root)
            {
                const NodeT *lo = root.get();
                while (lo->left)
                    lo = lo->left.get();
                const NodeT *hi = root.get();
                while (hi->right)
                    hi = hi->right.get();
                stats.min_key = lo->key;
                stats.max_key = hi->key;
            }
            return stats;
        }

        bool validate() const
        {
            std::shared_lock<std::shared_mutex> read_lock(rw);
            return validate_locked();
        }

    private:
        /*────────────────────────────────────────────────────────────────────────────
         *  Core data members
         *───────────────────────────────────────────────────────────────────────────*/

        /* Empty tree <=> root == nullptr. */
        NodePtr root;

        /* Number of nodes, maintained by insert / erase / clear. */
        std::size_t count{0};

        Compare comp;

        TreeOptions options;

        /* Guards root, count and every node below root.
         *  • shared_lock  – all read-only operations
         *  • unique_lock  – insert / erase / clear, held across rebalancing */
        mutable std::shared_mutex rw;

        /*───────────────────────────────────────────────────────────────────────────
          Height / balance bookkeeping
         ──────────────────────────────────────────────────────────────────────────*/
        static int height_of(const NodeT *n) { return n ? n->height : 0; }

        static int balance_of(const NodeT *n)
        {
            return n ? height_of(n->left.get()) - height_of(n->right.get()) : 0;
        }

        static void update(NodeT *n)
        {
            n->height = 1 + std::max(height_of(n->left.get()), height_of(n->right.get()));
        }

        /*===========================================================================
         *  Tree Rotations
         *===========================================================================
         *  Both helpers take the owning slot of the subtree root and leave the
         *  new subtree root in that same slot, so the caller never has to relink
         *  a parent.
         *
         *  Right rotation:
         *          y              x
         *         / \            / \
         *        x   γ  --->    α   y
         *       / \                / \
         *      α   β              β   γ
         *
         *  Left rotation is the mirror image.
         *===========================================================================*/
        static void rotate_right(NodePtr &slot)
        {
            NodePtr x = std::move(slot->left);
            assert(x && "rotate_right needs a left child");

            slot->left = std::move(x->right); // β moves under y
            update(slot.get());

            x->right = std::move(slot); // y becomes x's right child
            update(x.get());

            slot = std::move(x); // x takes y's place
        }

        static void rotate_left(NodePtr &slot)
        {
            NodePtr y = std::move(slot->right);
            assert(y && "rotate_left needs a right child");

            slot->right = std::move(y->left);
            update(slot.get());

            y->left = std::move(slot);
            update(y.get());

            slot = std::move(y);
        }

        const NodeT *find_node(const K &k) const
        {
            const NodeT *n = root.get();
            while (n)
            {
                if (comp(k, n->key))
                    n = n->left.get();
                else if (comp(n->key, k))
                    n = n->right.get();
                else
                    return n;
            }
            return nullptr;
        }

        /* --------------------------------------------------------------------------
         *  insert_rec
         *
         *  After a node was created somewhere below `slot`:
         *     balance > 1, k < left.key   → LL: rotate right
         *     balance > 1, k > left.key   → LR: rotate left child left, then right
         *     balance < -1, k > right.key → RR: rotate left
         *     balance < -1, k < right.key → RL: rotate right child right, then left
         *  k never equals the heavy child's key here: a child that matched k
         *  would have been overwritten, and a freshly created child cannot make
         *  its parent unbalanced.
         * -------------------------------------------------------------------------- */
        bool insert_rec(NodePtr &slot, const K &k, V v)
        {
            if (!slot)
            {
                slot = std::make_unique<NodeT>(k, std::move(v));
                return true;
            }

            bool created;
            if (comp(k, slot->key))
                created = insert_rec(slot->left, k, std::move(v));
            else if (comp(slot->key, k))
                created = insert_rec(slot->right, k, std::move(v));
            else
            {
                slot->val = std::move(v); // duplicate key: last write wins
                return false;
            }

            if (!created)
                return false; // overwrite below, heights unchanged

            update(slot.get());
            int balance = balance_of(slot.get());

            if (balance > 1)
            {
                if (comp(slot->left->key, k)) // LR
                    rotate_left(slot->left);
                rotate_right(slot); // LL
            }
            else if (balance < -1)
            {
                if (comp(k, slot->right->key)) // RL
                    rotate_right(slot->right);
                rotate_left(slot); // RR
            }
            return true;
        }

        bool erase_rec(NodePtr &slot, const K &k)
        {
            if (!slot)
                return false;

            if (comp(k, slot->key))
            {
                if (!erase_rec(slot->left, k))
                    return false;
            }
            else if (comp(slot->key, k))
            {
                if (!erase_rec(slot->right, k))
                    return false;
            }
            else if (!slot->left || !slot->right)
            {
                // splice: the (possibly empty) child replaces the node
                NodePtr child = std::move(slot->left ? slot->left : slot->right);
                slot = std::move(child);
                return true;
            }
            else
            {
                // two children: pull up the in-order successor
                NodeT *succ = slot->right.get();
                while (succ->left)
                    succ = succ->left.get();

                K succ_key = succ->key;
                slot->val = std::move(succ->val);
                slot->key = succ_key;

                bool removed = erase_rec(slot->right, succ_key);
                assert(removed && "successor must exist in the right subtree");
                (void)removed;
            }

            rebalance(slot);
            return true;
        }

        /* Four-case fix driven by the current children's balance factors. */
        static void rebalance(NodePtr &slot)
        {
            update(slot.get());
            int balance = balance_of(slot.get());

            if (balance > 1)
            {
                if (balance_of(slot->left.get()) < 0) // LR
                    rotate_left(slot->left);
                rotate_right(slot);
            }
            else if (balance < -1)
            {
                if (balance_of(slot->right.get()) > 0) // RL
                    rotate_right(slot->right);
                rotate_left(slot);
            }
        }

        /* Post-order walk: returns the derived height, accumulates the node count
         * and clears `balanced` on the first |left - right| > 1. */
        static int derive_rec(const NodeT *n, std::size_t &nodes, bool &balanced)
        {
            if (!n)
                return 0;
            ++nodes;
            int lh = derive_rec(n->left.get(), nodes, balanced);
            int rh = derive_rec(n->right.get(), nodes, balanced);
            if (std::abs(lh - rh) > 1)
                balanced = false;
            return 1 + std::max(lh, rh);
        }

        /*────────────────────────────────────────────────────────────────────────────
          validate_rec
          ─────────────
          Checks the subtree rooted at `n` against:
            • BST order against the bounds inherited from every ancestor
              (lo < key < hi), not just the direct parent;
            • AVL balance  |h(left) - h(right)| <= 1;
            • the cached height equals the derived one.
          Returns the derived height, or -1 on the first violation.
         ───────────────────────────────────────────────────────────────────────────*/
        int validate_rec(const NodeT *n, const K *lo, const K *hi, std::size_t &nodes) const
        {
            if (!n)
                return 0;

            if (lo && !comp(*lo, n->key))
                return -1;
            if (hi && !comp(n->key, *hi))
                return -1;

            ++nodes;
            int lh = validate_rec(n->left.get(), lo, &n->key, nodes);
            if (lh < 0)
                return -1;
            int rh = validate_rec(n->right.get(), &n->key, hi, nodes);
            if (rh < 0)
                return -1;

            if (std::abs(lh - rh) > 1)
                return -1;

            int h = 1 + std::max(lh, rh);
            return h == n->height ? h : -1;
        }

        bool validate_locked() const
        {
            std::size_t nodes = 0;
            return validate_rec(root.get(), nullptr, nullptr, nodes) >= 0 && nodes == count;
        }

        void verify_locked(const char *op) const
        {
            if (!options.verify_each_mutation)
                return;
            if (!validate_locked())
            {
                util::log(util::Level::Error, "avl invariant violated after {} (size {})", op, count);
                std::abort();
            }
        }
    };

} // namespace tavl

#endif // TAVL_AVL_TREE_HPP

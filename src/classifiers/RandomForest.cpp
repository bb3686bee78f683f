/**
 * @file RandomForest.cpp
 * @brief Random forest artifact parsing and inference
 */

#include "RandomForest.h"
#include "Errors.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace acoustix {

namespace {

/**
 * @brief Bộ đọc artifact theo dòng, bỏ qua dòng trống và comment
 */
class ArtifactReader {
public:
    ArtifactReader(std::istream& input, const std::string& source)
        : m_input(input), m_source(source), m_lineNumber(0) {}

    /// Đọc dòng có nội dung tiếp theo; false khi hết file
    bool next(std::istringstream& line) {
        std::string text;
        while (std::getline(m_input, text)) {
            ++m_lineNumber;
            size_t hash = text.find('#');
            if (hash != std::string::npos) {
                text.erase(hash);
            }
            if (text.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            line.clear();
            line.str(text);
            return true;
        }
        return false;
    }

    /// Đọc dòng bắt buộc
    void require(std::istringstream& line, const char* what) {
        if (!next(line)) {
            fail(std::string("unexpected end of file, expected ") + what);
        }
    }

    /// Đọc và kiểm tra từ khóa đầu dòng
    void expectKeyword(std::istringstream& line, const char* keyword) {
        std::string token;
        if (!(line >> token) || token != keyword) {
            fail(std::string("expected '") + keyword + "'");
        }
    }

    [[noreturn]] void fail(const std::string& message) const {
        std::ostringstream oss;
        oss << "Invalid forest artifact " << m_source << ":" << m_lineNumber << ": " << message;
        throw ModelUnavailableError(oss.str());
    }

private:
    std::istream& m_input;
    std::string m_source;
    int m_lineNumber;
};

template <typename T>
T readValue(std::istringstream& line, ArtifactReader& reader, const char* what) {
    T value;
    if (!(line >> value)) {
        reader.fail(std::string("cannot read ") + what);
    }
    return value;
}

std::vector<std::string> readNameList(std::istringstream& line, ArtifactReader& reader,
                                      const char* keyword) {
    reader.expectKeyword(line, keyword);
    long long count = readValue<long long>(line, reader, "count");
    if (count <= 0) {
        reader.fail(std::string(keyword) + " count must be positive");
    }
    std::vector<std::string> names;
    names.reserve(static_cast<size_t>(count));
    for (long long i = 0; i < count; ++i) {
        names.push_back(readValue<std::string>(line, reader, "name"));
    }
    std::string extra;
    if (line >> extra) {
        reader.fail(std::string("too many ") + keyword + " names");
    }
    return names;
}

} // anonymous namespace

// ============================================================================
// DecisionTree
// ============================================================================

const std::vector<double>& DecisionTree::predict(const std::vector<float>& features) const {
    /**
     * Duyệt từ gốc: x[feature] <= threshold => trái, ngược lại => phải.
     * Artifact đã được kiểm tra: con luôn có id lớn hơn cha nên vòng
     * lặp chắc chắn dừng.
     */
    size_t node = 0;
    while (!m_nodes[node].isLeaf) {
        const TreeNode& current = m_nodes[node];
        double value = static_cast<double>(features[static_cast<size_t>(current.featureIndex)]);
        node = static_cast<size_t>(value <= current.threshold ? current.leftChild
                                                              : current.rightChild);
    }
    return m_nodes[node].leafProbs;
}

int DecisionTree::getDepth() const {
    if (m_nodes.empty()) {
        return 0;
    }
    std::vector<int> depth(m_nodes.size(), 0);
    int maxDepth = 0;
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        const TreeNode& node = m_nodes[i];
        maxDepth = std::max(maxDepth, depth[i]);
        if (!node.isLeaf) {
            depth[static_cast<size_t>(node.leftChild)] = depth[i] + 1;
            depth[static_cast<size_t>(node.rightChild)] = depth[i] + 1;
        }
    }
    return maxDepth;
}

// ============================================================================
// RandomForest
// ============================================================================

RandomForest::RandomForest(std::vector<std::string> classNames,
                           std::vector<std::string> featureNames,
                           std::vector<DecisionTree> trees)
    : m_classNames(std::move(classNames))
    , m_featureNames(std::move(featureNames))
    , m_trees(std::move(trees))
{
}

std::shared_ptr<RandomForest> RandomForest::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ModelUnavailableError("Cannot open model artifact: " + path);
    }
    return loadFromStream(file, path);
}

std::shared_ptr<RandomForest> RandomForest::loadFromStream(std::istream& input,
                                                           const std::string& source) {
    ArtifactReader reader(input, source);
    std::istringstream line;

    // ----- Header -----
    reader.require(line, "format line");
    reader.expectKeyword(line, "format");
    std::string formatName = readValue<std::string>(line, reader, "format name");
    int version = readValue<int>(line, reader, "format version");
    if (formatName != FOREST_FORMAT_NAME || version != FOREST_FORMAT_VERSION) {
        std::ostringstream oss;
        oss << "unsupported format '" << formatName << " " << version << "', expected '"
            << FOREST_FORMAT_NAME << " " << FOREST_FORMAT_VERSION << "'";
        reader.fail(oss.str());
    }

    reader.require(line, "classes line");
    std::vector<std::string> classNames = readNameList(line, reader, "classes");

    reader.require(line, "features line");
    std::vector<std::string> featureNames = readNameList(line, reader, "features");

    reader.require(line, "trees line");
    reader.expectKeyword(line, "trees");
    long long numTrees = readValue<long long>(line, reader, "tree count");
    if (numTrees <= 0) {
        reader.fail("tree count must be positive");
    }

    const size_t numClasses = classNames.size();
    const int numFeatures = static_cast<int>(featureNames.size());

    // ----- Trees -----
    std::vector<DecisionTree> trees;
    trees.reserve(static_cast<size_t>(numTrees));

    for (long long t = 0; t < numTrees; ++t) {
        reader.require(line, "tree line");
        reader.expectKeyword(line, "tree");
        long long treeId = readValue<long long>(line, reader, "tree id");
        if (treeId != t) {
            reader.fail("trees must be numbered consecutively from 0");
        }
        reader.expectKeyword(line, "nodes");
        long long numNodes = readValue<long long>(line, reader, "node count");
        if (numNodes <= 0) {
            reader.fail("node count must be positive");
        }

        std::vector<TreeNode> nodes(static_cast<size_t>(numNodes));
        for (long long n = 0; n < numNodes; ++n) {
            reader.require(line, "node line");

            long long id = readValue<long long>(line, reader, "node id");
            if (id != n) {
                reader.fail("nodes must be listed in id order");
            }

            TreeNode& node = nodes[static_cast<size_t>(n)];
            node.leftChild = readValue<int>(line, reader, "left child");
            node.rightChild = readValue<int>(line, reader, "right child");
            node.featureIndex = readValue<int>(line, reader, "feature index");
            node.threshold = readValue<double>(line, reader, "threshold");

            node.leafProbs.resize(numClasses);
            double total = 0.0;
            for (size_t c = 0; c < numClasses; ++c) {
                double v = readValue<double>(line, reader, "class value");
                if (!(v >= 0.0)) {
                    reader.fail("class values must be non-negative");
                }
                node.leafProbs[c] = v;
                total += v;
            }
            std::string extra;
            if (line >> extra) {
                reader.fail("too many values on node line");
            }

            // Chuẩn hóa phân bố lớp (tổng 0 giữ nguyên)
            if (total > 0.0) {
                for (double& v : node.leafProbs) {
                    v /= total;
                }
            }

            node.isLeaf = (node.leftChild == -1 && node.rightChild == -1);
            if (!node.isLeaf) {
                if (node.leftChild <= n || node.rightChild <= n ||
                    node.leftChild >= numNodes || node.rightChild >= numNodes) {
                    reader.fail("child ids must follow their parent and be inside the tree");
                }
                if (node.featureIndex < 0 || node.featureIndex >= numFeatures) {
                    reader.fail("feature index out of range");
                }
            }
        }

        trees.emplace_back(std::move(nodes));
    }

    reader.require(line, "'end'");
    reader.expectKeyword(line, "end");

    std::cerr << "[RandomForest] Loaded " << trees.size() << " trees, "
              << numClasses << " classes, " << featureNames.size()
              << " features from " << source << std::endl;

    return std::make_shared<RandomForest>(std::move(classNames), std::move(featureNames),
                                          std::move(trees));
}

std::vector<double> RandomForest::predictProba(const std::vector<float>& features) const {
    /**
     * Trung bình phân bố lá của tất cả các cây
     */
    std::vector<double> probs(m_classNames.size(), 0.0);
    for (const auto& tree : m_trees) {
        const std::vector<double>& leaf = tree.predict(features);
        for (size_t c = 0; c < probs.size(); ++c) {
            probs[c] += leaf[c];
        }
    }

    if (!m_trees.empty()) {
        for (double& p : probs) {
            p /= static_cast<double>(m_trees.size());
        }
    }
    return probs;
}

std::string RandomForest::summary() const {
    size_t totalNodes = 0;
    int maxDepth = 0;
    for (const auto& tree : m_trees) {
        totalNodes += tree.getNodeCount();
        maxDepth = std::max(maxDepth, tree.getDepth());
    }

    std::ostringstream oss;
    oss << m_trees.size() << " trees, " << totalNodes << " nodes, max depth " << maxDepth
        << ", " << m_featureNames.size() << " features";
    return oss.str();
}

} // namespace acoustix

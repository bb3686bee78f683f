/**
 * @file RandomForest.h
 * @brief Pre-trained random forest loaded from a text artifact
 *
 * Định dạng artifact (mỗi token cách nhau bằng khoảng trắng, '#' là comment):
 *
 * @code
 *   format acoustix-forest 1
 *   classes 8 Asthma Bronchiectasis Bronchiolitis COPD Healthy LRTI Pneumonia URTI
 *   features 30 chroma_stft_mean chroma_stft_std ... zero_crossing_rate_min
 *   trees 100
 *   tree 0 nodes 57
 *   0 1 30 4 -261.25 12 3 0 40 9 2 1 0
 *   1 -1 -1 -2 -2 0 0 0 7 0 0 0 0
 *   ...
 *   end
 * @endcode
 *
 * Dòng node: id left right feature threshold v_0 .. v_{C-1}
 * Node lá có left = right = -1. Duyệt cây giống sklearn: x[feature] <= threshold
 * đi sang trái. Phân bố tại lá được chuẩn hóa về tổng 1; xác suất của
 * rừng là trung bình các cây.
 */

#ifndef ACOUSTIX_RANDOM_FOREST_H
#define ACOUSTIX_RANDOM_FOREST_H

#include "Classifier.h"

#include <istream>
#include <string>
#include <vector>

namespace acoustix {

/// Định danh định dạng artifact
constexpr const char* FOREST_FORMAT_NAME = "acoustix-forest";

/// Phiên bản định dạng artifact được hỗ trợ
constexpr int FOREST_FORMAT_VERSION = 1;

/**
 * @struct TreeNode
 * @brief Node trong cây quyết định (lưu dạng mảng)
 */
struct TreeNode {
    bool isLeaf;                        ///< Là node lá?
    int featureIndex;                   ///< Cột đặc trưng để split
    double threshold;                   ///< Ngưỡng split
    int leftChild;                      ///< Index node con trái
    int rightChild;                     ///< Index node con phải
    std::vector<double> leafProbs;      ///< Phân bố lớp tại node (đã chuẩn hóa)

    TreeNode() : isLeaf(false), featureIndex(-1), threshold(0.0),
                 leftChild(-1), rightChild(-1) {}
};

/**
 * @class DecisionTree
 * @brief Cây quyết định đơn lẻ
 */
class DecisionTree {
public:
    DecisionTree() = default;
    explicit DecisionTree(std::vector<TreeNode> nodes) : m_nodes(std::move(nodes)) {}

    /**
     * @brief Duyệt cây từ gốc tới lá
     * @return Phân bố lớp tại lá
     */
    const std::vector<double>& predict(const std::vector<float>& features) const;

    size_t getNodeCount() const { return m_nodes.size(); }
    int getDepth() const;
    const std::vector<TreeNode>& getNodes() const { return m_nodes; }

private:
    std::vector<TreeNode> m_nodes;
};

/**
 * @class RandomForest
 * @brief Rừng ngẫu nhiên đọc từ artifact văn bản
 */
class RandomForest : public ForestModel {
public:
    RandomForest(std::vector<std::string> classNames,
                 std::vector<std::string> featureNames,
                 std::vector<DecisionTree> trees);

    /**
     * @brief Đọc rừng từ file artifact
     * @throws ModelUnavailableError nếu không mở được file hoặc sai định dạng
     */
    static std::shared_ptr<RandomForest> loadFromFile(const std::string& path);

    /**
     * @brief Đọc rừng từ stream (source dùng cho thông báo lỗi)
     * @throws ModelUnavailableError nếu sai định dạng
     */
    static std::shared_ptr<RandomForest> loadFromStream(std::istream& input,
                                                        const std::string& source);

    std::vector<double> predictProba(const std::vector<float>& features) const override;
    const std::vector<std::string>& classNames() const override { return m_classNames; }
    const std::vector<std::string>& featureNames() const override { return m_featureNames; }
    size_t numFeatures() const override { return m_featureNames.size(); }
    std::string backendName() const override { return "native-forest"; }
    std::string summary() const override;

    size_t getNumTrees() const { return m_trees.size(); }

private:
    std::vector<std::string> m_classNames;
    std::vector<std::string> m_featureNames;
    std::vector<DecisionTree> m_trees;
};

} // namespace acoustix

#endif // ACOUSTIX_RANDOM_FOREST_H

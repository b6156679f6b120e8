#include "mininn/MiniNN.hpp"

#include <exception>
#include <filesystem>
#include <iostream>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <dataset> [model_out]\n"
                  << "  dataset: whitespace separated rows of 4 features followed by one-hot class columns" << std::endl;
        return 1;
    }

    try {
        const std::filesystem::path dataset_path = argv[1];

        MultiLayerNetwork<double> net(4, {16, 3}, std::vector<std::string>{"relu", "identity"});

        Matrix<double> dat = MiniNN::shuffleRows(MiniNN::loadDataset<double>(dataset_path));
        const auto [x, y] = MiniNN::splitColumns(dat, 4);
        auto split = MiniNN::trainValidationSplit(x, y, 0.8);

        Preprocessor<double> prep_input(split.x_train);
        const Matrix<double> x_train_pre = prep_input.apply(split.x_train);
        const Matrix<double> x_val_pre = prep_input.apply(split.x_val);

        TrainingParams params;
        params._batch_size = 8;
        params._epochs = 1000;
        params._learning_rate = 0.01;
        params._loss_function_e = LossFunctionType::SoftmaxCrossEntropy;
        params._shuffle = true;
        params._log_interval = 100;

        net.printNetworkInfo();
        Trainer<double> trainer(net, params);
        trainer.train(x_train_pre, split.y_train);

        std::cout << "Train loss = " << trainer.evalLoss(x_train_pre, split.y_train) << std::endl;
        std::cout << "Validation loss = " << trainer.evalLoss(x_val_pre, split.y_val) << std::endl;
        std::cout << "Validation accuracy: " << MiniNN::accuracy(net(x_val_pre), split.y_val) << std::endl;

        if (argc > 2) {
            const std::filesystem::path model_path = argv[2];
            MiniNN::saveNetwork(net, model_path);
            auto reloaded = MiniNN::loadNetwork<double>(model_path);
            std::cout << "Model saved to " << model_path << ", reloaded validation accuracy: "
                      << MiniNN::accuracy(reloaded(x_val_pre), split.y_val) << std::endl;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

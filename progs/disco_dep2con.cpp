//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

//
// convert discourse dependency trees into binary constituency trees
//
// input: blank line separated blocks of
//
// # key = value
// node first..last head relation [nuclearity [sentence]]
//

#include <iostream>
#include <sstream>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstdlib>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread.hpp>
#include <boost/lexical_cast.hpp>

#include <disco/dependency_tree.hpp>
#include <disco/constituency_tree.hpp>
#include <disco/relation_statistics.hpp>
#include <disco/nuclearity_classifier.hpp>
#include <disco/attachment_ranker.hpp>
#include <disco/dep2con.hpp>

#include "utils/compress_stream.hpp"
#include "utils/resource.hpp"

typedef boost::filesystem::path path_type;

typedef disco::DependencyTree       dependency_type;
typedef disco::ConstituencyTree     tree_type;
typedef disco::RelationStatistics   statistics_type;
typedef disco::NuclearityClassifier classifier_type;
typedef disco::AttachmentRanker     ranker_type;
typedef disco::Dep2Con              dep2con_type;

typedef std::vector<dependency_type, std::allocator<dependency_type> > dependency_set_type;
typedef std::vector<std::string, std::allocator<std::string> >         output_set_type;

path_type input_file = "-";
path_type output_file = "-";
path_type statistics_file;
path_type training_file;

std::string ranker_name = "id";
std::string nuclearity_name = "unamb_else_most_frequent";

bool override_nuclearity = false;
bool skip_invalid = false;
bool list_mode = false;

int threads = 1;

int debug = 0;

void options(int argc, char** argv);

void read_trees(const path_type& path, dependency_set_type& trees)
{
  if (path != "-" && ! boost::filesystem::exists(path))
    throw std::runtime_error("no file? " + path.string());

  utils::compress_istream is(path, 1024 * 1024);

  dependency_type tree;
  while (is >> tree) {
    trees.push_back(dependency_type());
    trees.back().swap(tree);
  }

  if (is.bad())
    throw std::runtime_error("failed to read " + path.string());
}

// converts every shards-th tree starting at shard
struct Task
{
  Task(const dep2con_type& __dep2con,
       const dependency_set_type& __trees,
       output_set_type& __outputs,
       output_set_type& __errors,
       const size_t __shard,
       const size_t __shards)
    : dep2con(__dep2con), trees(__trees), outputs(__outputs), errors(__errors), shard(__shard), shards(__shards) {}

  void operator()()
  {
    tree_type tree;

    for (size_t i = shard; i < trees.size(); i += shards) {
      // failures are kept per document and reported by the caller
      try {
	dep2con(trees[i], tree);

	std::ostringstream os;
	os << trees[i].metadata << tree << '\n';
	outputs[i] = os.str();
      }
      catch (std::exception& err) {
	errors[i] = err.what();
      }
    }
  }

  const dep2con_type&        dep2con;
  const dependency_set_type& trees;
  output_set_type&           outputs;
  output_set_type&           errors;

  size_t shard;
  size_t shards;
};

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    if (list_mode) {
      std::cout << "nuclearity strategies:\n" << classifier_type::lists()
		<< "attachment ranking strategies:\n" << ranker_type::lists();
      return 0;
    }

    if (threads <= 0)
      threads = 1;

    // both are validated here, before reading any data
    classifier_type classifier(nuclearity_name, debug);
    ranker_type     ranker(ranker_name, debug);

    {
      dependency_set_type training;
      classifier_type::nuclearity_map_type labels;

      if (! training_file.empty())
	read_trees(training_file, training);

      for (dependency_set_type::const_iterator titer = training.begin(); titer != training.end(); ++ titer)
	labels.push_back(titer->nuclearity);

      if (! statistics_file.empty())
	classifier.fit(training, labels, statistics_type(statistics_file));
      else
	classifier.fit(training, labels);

      if (debug)
	std::cerr << "# of training trees: " << training.size() << std::endl;
    }

    const dep2con_type dep2con(classifier, ranker, override_nuclearity, debug);

    dependency_set_type trees;
    read_trees(input_file, trees);

    if (debug)
      std::cerr << "# of trees: " << trees.size() << std::endl;

    utils::resource start;

    output_set_type outputs(trees.size());
    output_set_type errors(trees.size());

    if (threads == 1)
      Task(dep2con, trees, outputs, errors, 0, 1)();
    else {
      typedef std::vector<Task, std::allocator<Task> > task_set_type;

      task_set_type tasks;
      for (int i = 0; i != threads; ++ i)
	tasks.push_back(Task(dep2con, trees, outputs, errors, i, threads));

      boost::thread_group workers;
      for (int i = 0; i != threads; ++ i)
	workers.add_thread(new boost::thread(boost::ref(tasks[i])));

      workers.join_all();
    }

    utils::resource end;

    if (debug)
      std::cerr << "convert cpu time:  " << end.cpu_time() - start.cpu_time() << std::endl
		<< "convert user time: " << end.user_time() - start.user_time() << std::endl;

    utils::compress_ostream os(output_file, 1024 * 1024);

    size_t num_skipped = 0;
    for (size_t i = 0; i != trees.size(); ++ i) {
      if (! errors[i].empty()) {
	const std::string& id = trees[i].metadata.get("id");
	const std::string name = (id.empty() ? "#" + boost::lexical_cast<std::string>(i + 1) : id);

	if (! skip_invalid)
	  throw std::runtime_error("tree " + name + ": " + errors[i]);

	std::cerr << "skip: tree " << name << ": " << errors[i] << std::endl;
	++ num_skipped;
	continue;
      }

      os << outputs[i];
    }

    if (debug)
      std::cerr << "# of skipped trees: " << num_skipped << std::endl;
  }
  catch (std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;

  po::options_description opts_config("configuration options");

  opts_config.add_options()
    ("input",      po::value<path_type>(&input_file)->default_value(input_file),   "input dependency trees")
    ("output",     po::value<path_type>(&output_file)->default_value(output_file), "output constituency trees")
    ("statistics", po::value<path_type>(&statistics_file),                         "relation statistics (relation pattern count)")
    ("training",   po::value<path_type>(&training_file),                           "training dependency trees with gold nuclearity")

    ("ranker",     po::value<std::string>(&ranker_name)->default_value(ranker_name),         "attachment ranking strategy")
    ("nuclearity", po::value<std::string>(&nuclearity_name)->default_value(nuclearity_name), "nuclearity strategy")

    ("override-nuclearity", po::bool_switch(&override_nuclearity), "predict nuclearity even when given")
    ("skip-invalid",        po::bool_switch(&skip_invalid),        "report and skip trees which cannot be converted")

    ("threads", po::value<int>(&threads), "# of threads")
    ;

  po::options_description opts_command("command line options");
  opts_command.add_options()
    ("list",  po::bool_switch(&list_mode),                "list strategies")
    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")
    ("help", "help message");

  po::options_description desc_command;

  desc_command.add(opts_config).add(opts_command);

  po::variables_map variables;

  po::store(po::parse_command_line(argc, argv, desc_command, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), variables);

  po::notify(variables);

  if (variables.count("help")) {
    std::cout << argv[0] << " [options]\n"
	      << desc_command << std::endl;
    exit(0);
  }
}
